#pragma once

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <boost/core/noncopyable.hpp>
#include <boost/format.hpp>
#include <boost/throw_exception.hpp>

#include "cppinject/ComponentDescriptor.hpp"
#include "cppinject/Exceptions.hpp"
#include "cppinject/TypeKey.hpp"

namespace cppinject
{

class Resolver;

/// @brief Holds the single instance of every resolved capability
///
/// Read-only for everybody but the Resolver. An entry is never replaced once it is
/// stored, so lookups need no locking after initialization has finished
class InstanceCache : private boost::noncopyable
{
public:
    InstanceCache()
        : instances_()
    {
    }

    /// @param[in] capability The capability to look up
    /// @returns The instance holder, which contains a std::shared_ptr to the capability
    /// @throws UnresolvedCapabilityException If no instance exists for the capability
    const Instance& get [[nodiscard]] (const Capability& capability) const
    {
        using boost::format;
        using boost::str;

        auto iter = instances_.find(capability);

        if (iter == instances_.end())
        {
            static const format fmt("No instance of %1% has been created");
            BOOST_THROW_EXCEPTION(UnresolvedCapabilityException()
                                  << StringInfo(str(format(fmt) % capability.name()))
                                  << CapabilityInfo(capability.name()));
        }

        return iter->second;
    }

    /// Returns the shared instance of a capability
    /// @tparam T The capability type
    /// @throws UnresolvedCapabilityException If no instance exists for the capability
    template <class T>
    std::shared_ptr<T> get [[nodiscard]] () const
    {
        return instanceCast<T>(get(TypeKey::of<T>()));
    }

    bool contains [[nodiscard]] (const Capability& capability) const
    {
        return instances_.count(capability) > 0;
    }

    std::unordered_set<Capability> capabilities() const
    {
        std::unordered_set<Capability> result;

        for (const auto& item : instances_)
        {
            result.insert(item.first);
        }

        return result;
    }

    std::size_t size [[nodiscard]] () const
    {
        return instances_.size();
    }

    bool empty [[nodiscard]] () const
    {
        return instances_.empty();
    }

private:
    friend class Resolver;

    // Keeps the existing entry if the capability already has one
    void put(const Capability& capability, Instance instance)
    {
        instances_.emplace(capability, std::move(instance));
    }

    std::unordered_map<Capability, Instance> instances_;
};

//----------------------------------------------------------------------------------------------------------------------
} // cppinject
//----------------------------------------------------------------------------------------------------------------------
