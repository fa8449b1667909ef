#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <boost/core/demangle.hpp>

namespace cppinject
{

/// Identity of a C++ type inside the container. Keys compare and hash by the
/// underlying std::type_info, never by their display name, so two distinct types
/// may carry the same name. A default constructed key is empty and is rejected as
/// invalid input wherever a key is expected
class TypeKey
{
public:
    TypeKey() noexcept
        : type_(nullptr)
        , name_()
    {
    }

    /// @param[in] type The type the key stands for
    /// @param[in] name The display name used in logs and error messages
    TypeKey(const std::type_info& type, std::string name)
        : type_(&type)
        , name_(std::move(name))
    {
    }

    /// Builds the key of a type, named after its demangled type name
    /// @tparam T The type, cv-qualifiers and references are dropped
    template <class T>
    static TypeKey of()
    {
        const std::type_info& type = typeid(std::decay_t<T>);
        return TypeKey(type, boost::core::demangle(type.name()));
    }

    /// Builds the key of a type with a custom display name
    /// @tparam T The type, cv-qualifiers and references are dropped
    /// @param[in] name The display name
    template <class T>
    static TypeKey of(std::string name)
    {
        return TypeKey(typeid(std::decay_t<T>), std::move(name));
    }

    bool empty() const noexcept
    {
        return type_ == nullptr;
    }

    const std::string& name() const noexcept
    {
        return name_;
    }

    std::size_t hash() const noexcept
    {
        return empty() ? 0 : std::type_index(*type_).hash_code();
    }

    bool operator==(const TypeKey& rhs) const noexcept
    {
        if (empty() || rhs.empty())
        {
            return empty() && rhs.empty();
        }

        return std::type_index(*type_) == std::type_index(*rhs.type_);
    }

    bool operator!=(const TypeKey& rhs) const noexcept
    {
        return !(*this == rhs);
    }

    bool operator<(const TypeKey& rhs) const noexcept
    {
        if (empty() || rhs.empty())
        {
            return empty() && !rhs.empty();
        }

        return std::type_index(*type_) < std::type_index(*rhs.type_);
    }

private:
    const std::type_info* type_;
    std::string name_;
};

/// A key naming an abstract service type
using Capability = TypeKey;

inline std::ostream& operator<<(std::ostream& os, const TypeKey& key)
{
    return os << (key.empty() ? std::string("<empty>") : key.name());
}

//----------------------------------------------------------------------------------------------------------------------
} // cppinject
//----------------------------------------------------------------------------------------------------------------------

namespace std
{

template <>
struct hash<cppinject::TypeKey>
{
    std::size_t operator()(const cppinject::TypeKey& key) const noexcept
    {
        return key.hash();
    }
};

} // std
