#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/any.hpp>
#include <boost/core/demangle.hpp>
#include <boost/core/noncopyable.hpp>
#include <boost/format.hpp>
#include <boost/throw_exception.hpp>

#include "cppinject/Exceptions.hpp"
#include "cppinject/TypeKey.hpp"

namespace cppinject
{

/// An object held by the container. The holder always contains a
/// std::shared_ptr<I>, where I is the capability the object was created for
using Instance = boost::any;

/// Resolved dependency instances, in constructor parameter order
using Instances = std::vector<Instance>;

/// @brief Static description of one component implementation
///
/// A descriptor states which capabilities an implementation provides, the ordered
/// capabilities its single constructor requires and a factory that builds the
/// implementation once those dependencies are available. Descriptors are immutable
/// and shared between the registry entries of all their capabilities
class ComponentDescriptor : private boost::noncopyable
{
public:
    /// Builds the implementation from its resolved dependencies
    using Factory = std::function<std::shared_ptr<void>(const Instances&)>;

    /// Converts a freshly built implementation into the instance of one capability
    using Binder = std::function<Instance(const std::shared_ptr<void>&)>;

    struct Binding
    {
        Capability capability;
        Binder bind;
    };

    /// @param[in] implementation The key of the concrete type
    /// @param[in] bindings One binding per capability the implementation provides
    /// @param[in] dependencies The capabilities required by the constructor, in order
    /// @param[in] factory The function creating the implementation
    /// @throws InvalidInputException If a key is empty, a function is missing or no
    ///     capability is declared
    ComponentDescriptor(TypeKey implementation,
                        std::vector<Binding> bindings,
                        std::vector<Capability> dependencies,
                        Factory factory)
        : implementation_(std::move(implementation))
        , bindings_(std::move(bindings))
        , dependencies_(std::move(dependencies))
        , factory_(std::move(factory))
    {
        validate();
    }

    const TypeKey& implementation() const noexcept
    {
        return implementation_;
    }

    std::vector<Capability> capabilities() const
    {
        std::vector<Capability> result;
        result.reserve(bindings_.size());

        for (const auto& binding : bindings_)
        {
            result.push_back(binding.capability);
        }

        return result;
    }

    bool implements [[nodiscard]] (const Capability& capability) const
    {
        return findBinding(capability) != nullptr;
    }

    const std::vector<Capability>& dependencies() const noexcept
    {
        return dependencies_;
    }

    /// Runs the factory and exposes the new object as the given capability
    /// @param[in] capability One of the capabilities of this descriptor
    /// @param[in] dependencies The dependency instances, in declared order
    /// @returns The instance holding a std::shared_ptr to the capability type
    /// @throws InvalidInputException If the capability isn't provided or the number
    ///     of dependencies doesn't match
    /// @throws InstanceCreationFailureException If the factory returns no object
    Instance create(const Capability& capability, const Instances& dependencies) const
    {
        using boost::format;
        using boost::str;

        const Binding* binding = findBinding(capability);

        if (binding == nullptr)
        {
            static const format fmt("%1% does not implement %2%");
            BOOST_THROW_EXCEPTION(InvalidInputException()
                                  << StringInfo(str(format(fmt) % implementation_.name() %
                                                    capability.name()))
                                  << CapabilityInfo(capability.name())
                                  << ComponentInfo(implementation_.name()));
        }

        if (dependencies.size() != dependencies_.size())
        {
            static const format fmt("%1% expects %2% dependencies, got %3%");
            BOOST_THROW_EXCEPTION(InvalidInputException()
                                  << StringInfo(str(format(fmt) % implementation_.name() %
                                                    dependencies_.size() %
                                                    dependencies.size()))
                                  << ComponentInfo(implementation_.name()));
        }

        std::shared_ptr<void> object = factory_(dependencies);

        if (!object)
        {
            static const format fmt("Factory of %1% returned no object");
            BOOST_THROW_EXCEPTION(InstanceCreationFailureException()
                                  << StringInfo(str(format(fmt) % implementation_.name()))
                                  << CapabilityInfo(capability.name())
                                  << ComponentInfo(implementation_.name()));
        }

        return binding->bind(object);
    }

private:
    const Binding* findBinding(const Capability& capability) const
    {
        for (const auto& binding : bindings_)
        {
            if (binding.capability == capability)
            {
                return &binding;
            }
        }

        return nullptr;
    }

    void validate() const
    {
        if (implementation_.empty())
        {
            BOOST_THROW_EXCEPTION(InvalidInputException()
                                  << StringInfo("Implementation type cannot be empty"));
        }

        if (!factory_)
        {
            throwInvalid("Component %1% has no factory");
        }

        if (bindings_.empty())
        {
            throwInvalid("Component %1% does not declare any capability");
        }

        for (const auto& binding : bindings_)
        {
            if (binding.capability.empty() || !binding.bind)
            {
                throwInvalid("Component %1% declares an empty capability");
            }
        }

        for (const auto& dependency : dependencies_)
        {
            if (dependency.empty())
            {
                throwInvalid("Component %1% declares an empty dependency");
            }
        }
    }

    [[noreturn]] void throwInvalid(const char* message) const
    {
        using boost::format;
        using boost::str;

        BOOST_THROW_EXCEPTION(InvalidInputException()
                              << StringInfo(str(format(message) % implementation_.name()))
                              << ComponentInfo(implementation_.name()));
    }

    TypeKey implementation_;
    std::vector<Binding> bindings_;
    std::vector<Capability> dependencies_;
    Factory factory_;
};

using ComponentDescriptorPtr = std::shared_ptr<const ComponentDescriptor>;

/// Unwraps the shared pointer held by an instance
/// @tparam T The capability type the instance was created for, optionally cv-qualified
/// @throws InvalidInputException If the holder doesn't contain a std::shared_ptr<T>
template <class T>
std::shared_ptr<T> instanceCast(const Instance& instance)
{
    using boost::format;
    using boost::str;
    using Held = std::shared_ptr<std::remove_cv_t<T>>;

    const auto* holder = boost::any_cast<Held>(&instance);

    if (holder == nullptr)
    {
        static const format fmt("Holder type doesn't match expected holder type %1% != %2%");
        BOOST_THROW_EXCEPTION(
            InvalidInputException()
            << StringInfo(str(format(fmt) % boost::core::demangle(instance.type().name()) %
                              TypeKey::of<Held>().name()))
            << CapabilityInfo(TypeKey::of<T>().name()));
    }

    return *holder;
}

/// Lists the capabilities a component provides
template <class... TInterfaces>
struct Implements
{
};

/// Lists the capabilities a component's constructor takes, in parameter order. Each
/// one is passed as a std::shared_ptr
template <class... TDependencies>
struct Requires
{
};

namespace detail
{

template <class TImpl, class TInterface>
ComponentDescriptor::Binding makeBinding()
{
    static_assert(std::is_base_of_v<TInterface, TImpl>,
                  "A component must derive from every capability it implements");

    return {TypeKey::of<TInterface>(), [](const std::shared_ptr<void>& object) {
                std::shared_ptr<TInterface> instance = std::static_pointer_cast<TImpl>(object);
                return Instance(std::move(instance));
            }};
}

template <class T>
std::shared_ptr<T> dependencyAt(const Instances& dependencies, std::size_t index)
{
    return instanceCast<T>(dependencies.at(index));
}

template <class TImpl, class... TDependencies, std::size_t... Index>
std::shared_ptr<void> construct(const Instances& dependencies, std::index_sequence<Index...>)
{
    return std::make_shared<TImpl>(dependencyAt<TDependencies>(dependencies, Index)...);
}

} // detail

/// Describes a component from its C++ types
/// @tparam TImpl The concrete type, constructible from std::shared_ptr<TDependencies>...
/// @tparam TInterfaces The capabilities it provides
/// @tparam TDependencies The capabilities its constructor takes
/// @returns The shared descriptor
template <class TImpl, class... TInterfaces, class... TDependencies>
ComponentDescriptorPtr makeComponent(Implements<TInterfaces...>, Requires<TDependencies...>)
{
    static_assert(sizeof...(TInterfaces) > 0,
                  "A component must implement at least one capability");
    static_assert(std::is_constructible_v<TImpl, std::shared_ptr<TDependencies>...>,
                  "The component constructor must take the required capabilities in order");

    ComponentDescriptor::Factory factory = [](const Instances& dependencies) {
        return detail::construct<TImpl, TDependencies...>(
            dependencies, std::index_sequence_for<TDependencies...>{});
    };

    return std::make_shared<ComponentDescriptor>(
        TypeKey::of<TImpl>(),
        std::vector<ComponentDescriptor::Binding>{
            detail::makeBinding<TImpl, TInterfaces>()...},
        std::vector<Capability>{TypeKey::of<TDependencies>()...},
        std::move(factory));
}

/// Describes a component with a default constructor
template <class TImpl, class... TInterfaces>
ComponentDescriptorPtr makeComponent(Implements<TInterfaces...> interfaces)
{
    return makeComponent<TImpl>(interfaces, Requires<>{});
}

//----------------------------------------------------------------------------------------------------------------------
} // cppinject
//----------------------------------------------------------------------------------------------------------------------
