#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <boost/core/noncopyable.hpp>
#include <boost/exception/all.hpp>
#include <boost/format.hpp>
#include <boost/throw_exception.hpp>

#include <spdlog/spdlog.h>

#include "cppinject/ComponentDescriptor.hpp"
#include "cppinject/Exceptions.hpp"
#include "cppinject/InstanceCache.hpp"
#include "cppinject/Logging.hpp"
#include "cppinject/Registry.hpp"
#include "cppinject/TypeKey.hpp"

namespace cppinject
{

/// @brief Turns the registry into a fully populated instance cache
///
/// Resolution is a depth-first walk over the dependency graph. Implementations that
/// are still being constructed are marked, so reaching one of them again is a back
/// edge, i.e. a cycle. Marks are keyed by implementation, not by capability: two
/// capabilities backed by the same implementation share a mark.
///
/// Instances created during a pass are staged and only committed to the cache once
/// the whole pass succeeded. A failing pass leaves the cache as it was
class Resolver : private boost::noncopyable
{
public:
    Resolver(const Registry& registry,
             InstanceCache& cache,
             std::shared_ptr<spdlog::logger> logger = nullptr)
        : registry_(registry)
        , cache_(cache)
        , logger_(logger ? std::move(logger) : defaultLogger())
        , inProgress_()
        , path_()
    {
    }

    /// Creates an instance of every registered capability
    /// @throws UnregisteredCapabilityException If a dependency has no registration
    /// @throws CircularDependencyException If the dependency graph has a cycle
    /// @throws InstanceCreationFailureException If a factory fails
    void initializeAll()
    {
        Staged staged;

        for (const auto& capability : registry_.capabilities())
        {
            resolve(capability, staged);
        }

        commit(staged);
    }

    /// Creates the instance of a capability and of everything it depends on
    /// @param[in] capability The capability to resolve
    /// @throws The same exceptions as initializeAll()
    void resolve(const Capability& capability)
    {
        Staged staged;
        resolve(capability, staged);
        commit(staged);
    }

    /// @returns The number of implementations currently under construction
    std::size_t inProgress [[nodiscard]] () const
    {
        return inProgress_.size();
    }

private:
    using Staged = std::unordered_map<Capability, Instance>;

    // Marks an implementation as under construction for the lifetime of the guard
    class CreationGuard : private boost::noncopyable
    {
    public:
        CreationGuard(Resolver& parent, const Capability& capability, const TypeKey& implementation)
            : parent_(parent)
            , implementation_(implementation)
        {
            parent_.inProgress_.insert(implementation_);
            parent_.path_.emplace_back(capability, implementation_);
        }

        ~CreationGuard()
        {
            parent_.path_.pop_back();
            parent_.inProgress_.erase(implementation_);
        }

    private:
        Resolver& parent_;
        TypeKey implementation_;
    };

    void resolve(const Capability& capability, Staged& staged)
    {
        using boost::format;
        using boost::str;

        if (capability.empty())
        {
            BOOST_THROW_EXCEPTION(InvalidInputException()
                                  << StringInfo("Capability cannot be empty"));
        }

        if (cache_.contains(capability) || staged.count(capability))
        {
            return;
        }

        ComponentDescriptorPtr descriptor = registry_.lookup(capability);

        if (!descriptor)
        {
            if (path_.empty())
            {
                static const format fmt("Type isn't registered: %1%");
                BOOST_THROW_EXCEPTION(UnregisteredCapabilityException()
                                      << StringInfo(str(format(fmt) % capability.name()))
                                      << CapabilityInfo(capability.name()));
            }

            static const format fmt("Type isn't registered: %1%, required by %2%");
            BOOST_THROW_EXCEPTION(UnregisteredCapabilityException()
                                  << StringInfo(str(format(fmt) % capability.name() %
                                                    path_.back().second.name()))
                                  << CapabilityInfo(capability.name())
                                  << ComponentInfo(path_.back().second.name()));
        }

        const TypeKey& implementation = descriptor->implementation();

        if (inProgress_.count(implementation))
        {
            const std::string cycle = cyclePath(capability, implementation);

            static const format fmt("Circular dependency detected for: %1% (%2%)");
            BOOST_THROW_EXCEPTION(CircularDependencyException()
                                  << StringInfo(str(format(fmt) % capability.name() % cycle))
                                  << CapabilityInfo(capability.name())
                                  << ComponentInfo(implementation.name())
                                  << CyclePathInfo(cycle));
        }

        CreationGuard guard(*this, capability, implementation);

        Instances dependencies;
        dependencies.reserve(descriptor->dependencies().size());

        for (const auto& dependency : descriptor->dependencies())
        {
            resolve(dependency, staged);
            dependencies.push_back(instanceOf(dependency, staged));
        }

        Instance instance = create(*descriptor, capability, dependencies);
        logger_->debug("Created: {} -> {}", capability.name(), implementation.name());
        staged.emplace(capability, std::move(instance));
    }

    Instance create(const ComponentDescriptor& descriptor,
                    const Capability& capability,
                    const Instances& dependencies) const
    {
        using boost::format;
        using boost::str;

        static const format fmt("Failed to create instance of %1% for %2%: %3%");

        try
        {
            return descriptor.create(capability, dependencies);
        }
        catch (const InjectException&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            BOOST_THROW_EXCEPTION(InstanceCreationFailureException()
                                  << StringInfo(str(format(fmt) %
                                                    descriptor.implementation().name() %
                                                    capability.name() % e.what()))
                                  << CapabilityInfo(capability.name())
                                  << ComponentInfo(descriptor.implementation().name())
                                  << boost::errinfo_nested_exception(boost::current_exception()));
        }
        catch (...)
        {
            BOOST_THROW_EXCEPTION(InstanceCreationFailureException()
                                  << StringInfo(str(format(fmt) %
                                                    descriptor.implementation().name() %
                                                    capability.name() % "unknown error"))
                                  << CapabilityInfo(capability.name())
                                  << ComponentInfo(descriptor.implementation().name())
                                  << boost::errinfo_nested_exception(boost::current_exception()));
        }
    }

    const Instance& instanceOf(const Capability& capability, const Staged& staged) const
    {
        auto iter = staged.find(capability);
        return iter != staged.end() ? iter->second : cache_.get(capability);
    }

    // Capabilities from the first visit of the implementation back to it, e.g.
    // "UserService -> EmailService -> UserService"
    std::string cyclePath(const Capability& capability, const TypeKey& implementation) const
    {
        std::vector<std::string> names;
        bool inCycle = false;

        for (const auto& step : path_)
        {
            inCycle = inCycle || step.second == implementation;

            if (inCycle)
            {
                names.push_back(step.first.name());
            }
        }

        names.push_back(capability.name());
        return boost::algorithm::join(names, " -> ");
    }

    void commit(Staged& staged)
    {
        for (auto& item : staged)
        {
            cache_.put(item.first, std::move(item.second));
        }

        if (!staged.empty())
        {
            logger_->debug("Committed {} instances", staged.size());
        }
    }

    const Registry& registry_;

    InstanceCache& cache_;

    std::shared_ptr<spdlog::logger> logger_;

    // Implementations currently under construction
    std::unordered_set<TypeKey> inProgress_;

    // (capability, implementation) from the outermost resolution to the current one
    std::vector<std::pair<Capability, TypeKey>> path_;
};

//----------------------------------------------------------------------------------------------------------------------
} // cppinject
//----------------------------------------------------------------------------------------------------------------------
