#pragma once

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <boost/format.hpp>
#include <boost/throw_exception.hpp>

#include <spdlog/spdlog.h>

#include "cppinject/ComponentDescriptor.hpp"
#include "cppinject/Exceptions.hpp"
#include "cppinject/Logging.hpp"
#include "cppinject/TypeKey.hpp"

namespace cppinject
{

/// What happens when a capability is registered a second time with another component
enum class DuplicatePolicy
{
    /// The later registration replaces the earlier one
    Overwrite,
    /// The later registration fails with DuplicateRegistrationException
    Reject
};

/// @brief Maps each capability to the component chosen to implement it
///
/// Filled during the scan phase and only read afterwards
class Registry : private boost::noncopyable
{
public:
    explicit Registry(DuplicatePolicy policy = DuplicatePolicy::Overwrite,
                      std::shared_ptr<spdlog::logger> logger = nullptr)
        : policy_(policy)
        , logger_(logger ? std::move(logger) : defaultLogger())
        , components_()
    {
    }

    /// Binds a capability to a component
    /// @param[in] capability The capability, which the component must implement
    /// @param[in] descriptor The component
    /// @returns Reference to the Registry, for chaining operations
    /// @throws InvalidInputException If the capability is empty, the descriptor is null
    ///     or doesn't implement the capability
    /// @throws DuplicateRegistrationException If duplicates are rejected and another
    ///     component is already bound to the capability
    Registry& registerComponent(const Capability& capability, ComponentDescriptorPtr descriptor)
    {
        check(capability, descriptor);
        bind(capability, std::move(descriptor));
        return *this;
    }

    /// Binds every capability the component declares. Nothing is bound if any of
    /// them is rejected
    /// @param[in] descriptor The component
    /// @returns Reference to the Registry, for chaining operations
    /// @throws The same exceptions as registerComponent(const Capability&, ComponentDescriptorPtr)
    Registry& registerComponent(const ComponentDescriptorPtr& descriptor)
    {
        if (!descriptor)
        {
            BOOST_THROW_EXCEPTION(InvalidInputException()
                                  << StringInfo("Component cannot be empty"));
        }

        const std::vector<Capability> capabilities = descriptor->capabilities();

        for (const auto& capability : capabilities)
        {
            check(capability, descriptor);
        }

        for (const auto& capability : capabilities)
        {
            bind(capability, descriptor);
        }

        return *this;
    }

    /// @returns The component bound to the capability, or an empty pointer
    ComponentDescriptorPtr lookup [[nodiscard]] (const Capability& capability) const
    {
        auto iter = components_.find(capability);
        return iter == components_.end() ? nullptr : iter->second;
    }

    bool contains [[nodiscard]] (const Capability& capability) const
    {
        return components_.count(capability) > 0;
    }

    std::unordered_set<Capability> capabilities() const
    {
        std::unordered_set<Capability> result;

        for (const auto& item : components_)
        {
            result.insert(item.first);
        }

        return result;
    }

    std::size_t size [[nodiscard]] () const
    {
        return components_.size();
    }

    bool empty [[nodiscard]] () const
    {
        return components_.empty();
    }

    DuplicatePolicy policy() const
    {
        return policy_;
    }

private:
    // Throws if binding the capability to the descriptor would be refused
    void check(const Capability& capability, const ComponentDescriptorPtr& descriptor) const
    {
        using boost::format;
        using boost::str;

        if (capability.empty() || !descriptor)
        {
            BOOST_THROW_EXCEPTION(
                InvalidInputException()
                << StringInfo("Capability and component cannot be empty"));
        }

        if (!descriptor->implements(capability))
        {
            static const format fmt("%1% does not implement %2%");
            BOOST_THROW_EXCEPTION(InvalidInputException()
                                  << StringInfo(str(format(fmt) %
                                                    descriptor->implementation().name() %
                                                    capability.name()))
                                  << CapabilityInfo(capability.name())
                                  << ComponentInfo(descriptor->implementation().name()));
        }

        auto iter = components_.find(capability);

        if (iter != components_.end() && iter->second != descriptor &&
            policy_ == DuplicatePolicy::Reject)
        {
            static const format fmt("%1% is already implemented by %2%, cannot bind %3%");
            BOOST_THROW_EXCEPTION(
                DuplicateRegistrationException()
                << StringInfo(str(format(fmt) % capability.name() %
                                  iter->second->implementation().name() %
                                  descriptor->implementation().name()))
                << CapabilityInfo(capability.name())
                << ComponentInfo(descriptor->implementation().name()));
        }
    }

    // Expects check() to have passed
    void bind(const Capability& capability, ComponentDescriptorPtr descriptor)
    {
        auto iter = components_.find(capability);

        if (iter == components_.end())
        {
            logger_->info("Registered: {} -> {}",
                          capability.name(),
                          descriptor->implementation().name());
            components_.emplace(capability, std::move(descriptor));
            return;
        }

        if (iter->second == descriptor)
        {
            return;
        }

        logger_->warn("Overriding: {} -> {} (was {})",
                      capability.name(),
                      descriptor->implementation().name(),
                      iter->second->implementation().name());
        iter->second = std::move(descriptor);
    }

    DuplicatePolicy policy_;

    std::shared_ptr<spdlog::logger> logger_;

    // capability -> component
    std::unordered_map<Capability, ComponentDescriptorPtr> components_;
};

//----------------------------------------------------------------------------------------------------------------------
} // cppinject
//----------------------------------------------------------------------------------------------------------------------
