#pragma once

#include <exception>
#include <string>

#include <boost/exception/all.hpp>
#include <boost/throw_exception.hpp>

namespace cppinject
{

typedef boost::error_info<struct tag_errmsg, std::string> StringInfo;
typedef boost::error_info<struct tag_capability, std::string> CapabilityInfo;
typedef boost::error_info<struct tag_component, std::string> ComponentInfo;
typedef boost::error_info<struct tag_cycle_path, std::string> CyclePathInfo;
typedef boost::error_info<struct tag_package, std::string> PackageInfo;
typedef boost::error_info<struct tag_source, std::string> SourceInfo;

/// Base of every exception thrown by the container, so it's easier to track
/// exceptions that are due to container configuration or component creation.
/// Details travel as boost::error_info, use boost::diagnostic_information() or
/// boost::get_error_info<> to read them
class InjectException : virtual public boost::exception, virtual public std::exception
{
public:
    virtual const char* what() const noexcept override
    {
        return "Container threw an exception";
    }
};

/// A capability was requested, directly or as a dependency, with no registered
/// implementation
class UnregisteredCapabilityException : public InjectException
{
public:
    virtual const char* what() const noexcept override
    {
        return "Capability is not registered";
    }
};

/// A capability is registered but no instance exists for it yet
class UnresolvedCapabilityException : public InjectException
{
public:
    virtual const char* what() const noexcept override
    {
        return "Capability has no instance";
    }
};

/// An implementation was reached again while it was still being constructed
class CircularDependencyException : public InjectException
{
public:
    virtual const char* what() const noexcept override
    {
        return "Circular dependency detected";
    }
};

/// Empty keys, null descriptors, malformed component definitions and calls made
/// in the wrong phase
class InvalidInputException : public InjectException
{
public:
    virtual const char* what() const noexcept override
    {
        return "Invalid input";
    }
};

/// The factory of a component failed. The original exception is attached as
/// boost::errinfo_nested_exception
class InstanceCreationFailureException : public InjectException
{
public:
    virtual const char* what() const noexcept override
    {
        return "Failed to create instance";
    }
};

/// A second, different component was registered for a capability while the
/// container rejects duplicates
class DuplicateRegistrationException : public InjectException
{
public:
    virtual const char* what() const noexcept override
    {
        return "Capability is already registered";
    }
};

/// Returns the message attached to an exception, or what() when it has none
inline std::string messageOf(const InjectException& e)
{
    if (const std::string* message = boost::get_error_info<StringInfo>(e))
    {
        return *message;
    }

    return e.what();
}

//----------------------------------------------------------------------------------------------------------------------
} // cppinject
//----------------------------------------------------------------------------------------------------------------------
