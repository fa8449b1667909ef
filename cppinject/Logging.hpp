#pragma once

#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cppinject
{

/// Name of the logger shared by every container that wasn't given its own
inline const std::string& defaultLoggerName()
{
    static const std::string name("cppinject");
    return name;
}

/// Returns the "cppinject" logger, creating it on a colored stdout sink the first
/// time. A logger registered with spdlog under that name beforehand is reused.
/// Safe to call from several threads
inline std::shared_ptr<spdlog::logger> defaultLogger()
{
    if (auto existing = spdlog::get(defaultLoggerName()))
    {
        return existing;
    }

    try
    {
        auto logger = spdlog::stdout_color_mt(defaultLoggerName());
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return logger;
    }
    catch (const spdlog::spdlog_ex&)
    {
        // Another thread registered it in the meantime
        if (auto existing = spdlog::get(defaultLoggerName()))
        {
            return existing;
        }

        throw;
    }
}

//----------------------------------------------------------------------------------------------------------------------
} // cppinject
//----------------------------------------------------------------------------------------------------------------------
