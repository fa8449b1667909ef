#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include <boost/core/noncopyable.hpp>
#include <boost/format.hpp>
#include <boost/throw_exception.hpp>

#include <spdlog/spdlog.h>

#include "cppinject/ComponentDescriptor.hpp"
#include "cppinject/ComponentSource.hpp"
#include "cppinject/Exceptions.hpp"
#include "cppinject/InstanceCache.hpp"
#include "cppinject/Logging.hpp"
#include "cppinject/Registry.hpp"
#include "cppinject/Resolver.hpp"
#include "cppinject/TypeKey.hpp"

namespace cppinject
{

/// Settings of a Container
struct ContainerOptions
{
    /// How a second registration of the same capability is handled
    DuplicatePolicy duplicatePolicy = DuplicatePolicy::Overwrite;

    /// Where progress and failures are logged. Empty selects defaultLogger()
    std::shared_ptr<spdlog::logger> logger;
};

/// @brief Eager dependency injection container
///
/// Components are registered during a scan phase, either one by one or by scanning
/// a ComponentSource. initializeAll() then creates exactly one instance per
/// registered capability, injecting dependencies through the constructor, after
/// which the container is read-only. Containers are independent of each other;
/// there is no global state
class Container : private boost::noncopyable
{
public:
    explicit Container(ContainerOptions options = ContainerOptions())
        : logger_(options.logger ? std::move(options.logger) : defaultLogger())
        , registry_(options.duplicatePolicy, logger_)
        , cache_()
        , resolver_(registry_, cache_, logger_)
        , initialized_(false)
    {
    }

    /// Binds a capability to a component
    /// @returns Reference to the Container, for chaining operations
    /// @throws InvalidInputException If the arguments are empty or the container is
    ///     already initialized
    /// @throws DuplicateRegistrationException If duplicates are rejected
    Container& registerComponent(const Capability& capability, ComponentDescriptorPtr descriptor)
    {
        ensureScanPhase();
        registry_.registerComponent(capability, std::move(descriptor));
        return *this;
    }

    /// Binds every capability the component declares
    /// @returns Reference to the Container, for chaining operations
    Container& registerComponent(const ComponentDescriptorPtr& descriptor)
    {
        ensureScanPhase();
        registry_.registerComponent(descriptor);
        return *this;
    }

    /// Registers a component described by its types
    /// @tparam TImpl The concrete type
    /// @returns Reference to the Container, for chaining operations
    template <class TImpl, class... TInterfaces, class... TDependencies>
    Container& add(Implements<TInterfaces...> interfaces, Requires<TDependencies...> dependencies)
    {
        return registerComponent(makeComponent<TImpl>(interfaces, dependencies));
    }

    /// Registers a component with a default constructor
    /// @tparam TImpl The concrete type
    /// @returns Reference to the Container, for chaining operations
    template <class TImpl, class... TInterfaces>
    Container& add(Implements<TInterfaces...> interfaces)
    {
        return registerComponent(makeComponent<TImpl>(interfaces));
    }

    /// Registers every component a source discovers in a package, then creates all
    /// instances
    /// @param[in] source Where the components come from
    /// @param[in] package Dotted package name; empty selects everything
    /// @returns Reference to the Container, for chaining operations
    /// @throws InjectException Any registration or initialization error, with the
    ///     source and package attached as SourceInfo and PackageInfo
    Container& scan(const ComponentSource& source, const std::string& package = std::string())
    {
        logger_->info("Starting component scan of {} for package: {}", source.name(), package);

        try
        {
            for (const auto& descriptor : source.discover(package))
            {
                registerComponent(descriptor);
            }

            initializeAll();
        }
        catch (InjectException& e)
        {
            e << SourceInfo(source.name()) << PackageInfo(package);
            logger_->error("Failed to scan package {}: {}", package, messageOf(e));
            throw;
        }

        logger_->info("Component scan completed for package: {}", package);
        return *this;
    }

    /// Creates one instance of every registered capability. Either all instances are
    /// created or none is. Calling it again once it succeeded does nothing
    /// @throws UnregisteredCapabilityException If a dependency has no registration
    /// @throws CircularDependencyException If the dependency graph has a cycle
    /// @throws InstanceCreationFailureException If a factory fails
    void initializeAll()
    {
        if (initialized_)
        {
            return;
        }

        try
        {
            resolver_.initializeAll();
        }
        catch (const InjectException& e)
        {
            logger_->error("Initialization failed: {}", messageOf(e));
            throw;
        }

        initialized_ = true;
        logger_->info("Initialized {} instances", cache_.size());
    }

    /// Returns the instance of a capability
    /// @param[in] capability The capability
    /// @returns The holder of a std::shared_ptr to the capability type
    /// @throws InvalidInputException If the capability is empty
    /// @throws UnregisteredCapabilityException If nothing implements the capability
    /// @throws UnresolvedCapabilityException If the container isn't initialized yet
    const Instance& getInstance [[nodiscard]] (const Capability& capability) const
    {
        using boost::format;
        using boost::str;

        if (capability.empty())
        {
            BOOST_THROW_EXCEPTION(InvalidInputException()
                                  << StringInfo("Type cannot be null"));
        }

        if (!registry_.contains(capability))
        {
            static const format fmt("Type isn't registered: %1%");
            BOOST_THROW_EXCEPTION(UnregisteredCapabilityException()
                                  << StringInfo(str(format(fmt) % capability.name()))
                                  << CapabilityInfo(capability.name()));
        }

        return cache_.get(capability);
    }

    /// Returns the instance of a capability
    /// @tparam T The capability type
    /// @throws The same exceptions as getInstance(const Capability&)
    template <class T>
    std::shared_ptr<T> getInstance [[nodiscard]] () const
    {
        return instanceCast<T>(getInstance(TypeKey::of<T>()));
    }

    /// @returns \c true if an instance of the capability exists; \c false otherwise
    bool contains [[nodiscard]] (const Capability& capability) const
    {
        return cache_.contains(capability);
    }

    template <class T>
    bool contains [[nodiscard]] () const
    {
        return contains(TypeKey::of<T>());
    }

    bool initialized [[nodiscard]] () const
    {
        return initialized_;
    }

    /// Number of instances held by the container
    std::size_t size [[nodiscard]] () const
    {
        return cache_.size();
    }

    const Registry& registry() const
    {
        return registry_;
    }

private:
    void ensureScanPhase() const
    {
        if (initialized_)
        {
            BOOST_THROW_EXCEPTION(InvalidInputException() << StringInfo(
                                      "Components cannot be registered after initialization"));
        }
    }

    std::shared_ptr<spdlog::logger> logger_;

    Registry registry_;

    InstanceCache cache_;

    Resolver resolver_;

    bool initialized_;
};

//----------------------------------------------------------------------------------------------------------------------
} // cppinject
//----------------------------------------------------------------------------------------------------------------------
