#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>
#include <boost/throw_exception.hpp>

#include "cppinject/ComponentDescriptor.hpp"
#include "cppinject/Exceptions.hpp"
#include "cppinject/TypeKey.hpp"

namespace cppinject
{

/// @brief Finds the component definitions belonging to a package
///
/// The container only depends on this interface; how components are found (an
/// explicit list, a generated manifest, plugins) is up to the implementation
class ComponentSource
{
public:
    virtual ~ComponentSource()
    {
    }

    /// Name used in logs and attached to errors raised while scanning the source
    virtual std::string name() const = 0;

    /// @param[in] package Dotted package name; empty selects every component
    /// @returns The components of the package and its sub-packages
    virtual std::vector<ComponentDescriptorPtr> discover(const std::string& package) const = 0;
};

/// @brief A ComponentSource backed by an explicit list of components, each filed
/// under a dotted package name such as "example.service.user"
class ComponentCatalog : public ComponentSource
{
public:
    explicit ComponentCatalog(std::string name = "catalog")
        : name_(std::move(name))
        , entries_()
    {
    }

    /// Files a component under a package
    /// @param[in] package The package of the component
    /// @param[in] descriptor The component
    /// @returns Reference to the ComponentCatalog, for chaining operations
    /// @throws InvalidInputException If the descriptor is null or its implementation is
    ///     already listed, since an implementation has exactly one constructor
    ComponentCatalog& add(const std::string& package, ComponentDescriptorPtr descriptor)
    {
        using boost::format;
        using boost::str;

        if (!descriptor)
        {
            BOOST_THROW_EXCEPTION(InvalidInputException()
                                  << StringInfo("Component cannot be empty")
                                  << PackageInfo(package));
        }

        for (const auto& entry : entries_)
        {
            if (entry.descriptor->implementation() == descriptor->implementation())
            {
                static const format fmt("%1% has more than one constructor candidate");
                BOOST_THROW_EXCEPTION(
                    InvalidInputException()
                    << StringInfo(str(format(fmt) % descriptor->implementation().name()))
                    << ComponentInfo(descriptor->implementation().name())
                    << PackageInfo(package));
            }
        }

        entries_.push_back(Entry{package, std::move(descriptor)});
        return *this;
    }

    /// Files a component described by its types
    /// @tparam TImpl The concrete type
    template <class TImpl, class... TInterfaces, class... TDependencies>
    ComponentCatalog& add(const std::string& package,
                          Implements<TInterfaces...> interfaces,
                          Requires<TDependencies...> dependencies)
    {
        return add(package, makeComponent<TImpl>(interfaces, dependencies));
    }

    /// Files a component with a default constructor
    /// @tparam TImpl The concrete type
    template <class TImpl, class... TInterfaces>
    ComponentCatalog& add(const std::string& package, Implements<TInterfaces...> interfaces)
    {
        return add(package, makeComponent<TImpl>(interfaces));
    }

    std::string name() const override
    {
        return name_;
    }

    /// @throws InvalidInputException If no component lives in the package
    std::vector<ComponentDescriptorPtr> discover(const std::string& package) const override
    {
        using boost::format;
        using boost::str;

        std::vector<ComponentDescriptorPtr> result;

        for (const auto& entry : entries_)
        {
            if (contains(package, entry.package))
            {
                result.push_back(entry.descriptor);
            }
        }

        if (result.empty())
        {
            static const format fmt("Package not found: %1%");
            BOOST_THROW_EXCEPTION(InvalidInputException()
                                  << StringInfo(str(format(fmt) % package))
                                  << PackageInfo(package)
                                  << SourceInfo(name_));
        }

        return result;
    }

    std::size_t size() const
    {
        return entries_.size();
    }

private:
    struct Entry
    {
        std::string package;
        ComponentDescriptorPtr descriptor;
    };

    // "a.b" contains "a.b" and "a.b.c" but not "a.bc"
    static bool contains(const std::string& package, const std::string& candidate)
    {
        if (package.empty() || candidate == package)
        {
            return true;
        }

        return boost::algorithm::starts_with(candidate, package + ".");
    }

    std::string name_;
    std::vector<Entry> entries_;
};

//----------------------------------------------------------------------------------------------------------------------
} // cppinject
//----------------------------------------------------------------------------------------------------------------------
