#include <cppinject/Registry.hpp>

#include <memory>
#include <sstream>
#include <string>

#include <boost/exception/get_error_info.hpp>
#include <boost/test/unit_test.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include "Fixtures.hpp"

using namespace cppinject;
using namespace fixtures;

class RegistryFixture
{
public:
    RegistryFixture()
        : registry(DuplicatePolicy::Overwrite, quietLogger())
        , repo(makeComponent<Repo>(Implements<Repository>{}))
        , otherRepo(makeComponent<OtherRepo>(Implements<Repository>{}))
        , both(makeComponent<Both>(Implements<IFirst, ISecond>{}))
    {
    }

    Registry registry;
    ComponentDescriptorPtr repo;
    ComponentDescriptorPtr otherRepo;
    ComponentDescriptorPtr both;
};

BOOST_FIXTURE_TEST_SUITE(TestRegistry, RegistryFixture)

BOOST_AUTO_TEST_CASE(checkConstruction)
{
    BOOST_CHECK(registry.empty());
    BOOST_CHECK_EQUAL(registry.size(), 0u);
    BOOST_CHECK(registry.policy() == DuplicatePolicy::Overwrite);
    BOOST_CHECK(!registry.lookup(TypeKey::of<Repository>()));
}

BOOST_AUTO_TEST_CASE(checkRegisterAndLookup)
{
    registry.registerComponent(TypeKey::of<Repository>(), repo);

    BOOST_CHECK_EQUAL(registry.size(), 1u);
    BOOST_CHECK(registry.contains(TypeKey::of<Repository>()));
    BOOST_CHECK_EQUAL(registry.lookup(TypeKey::of<Repository>()), repo);
    BOOST_CHECK(!registry.lookup(TypeKey::of<Emailer>()));
}

BOOST_AUTO_TEST_CASE(checkRegisterEveryCapability)
{
    registry.registerComponent(both);

    auto capabilities = registry.capabilities();
    BOOST_CHECK_EQUAL(capabilities.size(), 2u);
    BOOST_CHECK(capabilities.count(TypeKey::of<IFirst>()));
    BOOST_CHECK(capabilities.count(TypeKey::of<ISecond>()));
    BOOST_CHECK_EQUAL(registry.lookup(TypeKey::of<IFirst>()), both);
    BOOST_CHECK_EQUAL(registry.lookup(TypeKey::of<ISecond>()), both);
}

BOOST_AUTO_TEST_CASE(checkLastRegistrationWins)
{
    registry.registerComponent(repo).registerComponent(otherRepo);

    BOOST_CHECK_EQUAL(registry.size(), 1u);
    BOOST_CHECK_EQUAL(registry.lookup(TypeKey::of<Repository>()), otherRepo);
}

BOOST_AUTO_TEST_CASE(checkRejectDuplicates)
{
    Registry strict(DuplicatePolicy::Reject, quietLogger());
    strict.registerComponent(repo);

    // Registering the very same component again is harmless
    BOOST_CHECK_NO_THROW(strict.registerComponent(repo));

    try
    {
        strict.registerComponent(otherRepo);
        BOOST_FAIL("Expected DuplicateRegistrationException");
    }
    catch (const DuplicateRegistrationException& e)
    {
        const std::string* capability = boost::get_error_info<CapabilityInfo>(e);
        BOOST_REQUIRE(capability != nullptr);
        BOOST_CHECK_EQUAL(*capability, "fixtures::Repository");
    }

    BOOST_CHECK_EQUAL(strict.lookup(TypeKey::of<Repository>()), repo);

    // A component whose second capability is taken is not bound to its first one either
    auto second = makeComponent<BothNeedingSecond>(Implements<IFirst, ISecond>{},
                                                   Requires<ISecond>{});
    strict.registerComponent(TypeKey::of<ISecond>(), second);

    BOOST_CHECK_THROW(strict.registerComponent(both), DuplicateRegistrationException);
    BOOST_CHECK_EQUAL(strict.size(), 2u);
    BOOST_CHECK(!strict.contains(TypeKey::of<IFirst>()));
    BOOST_CHECK(!strict.lookup(TypeKey::of<IFirst>()));
    BOOST_CHECK_EQUAL(strict.lookup(TypeKey::of<ISecond>()), second);
}

BOOST_AUTO_TEST_CASE(checkInvalidInput)
{
    BOOST_CHECK_THROW(registry.registerComponent(TypeKey(), repo), InvalidInputException);
    BOOST_CHECK_THROW(registry.registerComponent(TypeKey::of<Repository>(), nullptr),
                      InvalidInputException);
    BOOST_CHECK_THROW(registry.registerComponent(ComponentDescriptorPtr()), InvalidInputException);

    // Repo doesn't implement Emailer
    BOOST_CHECK_THROW(registry.registerComponent(TypeKey::of<Emailer>(), repo),
                      InvalidInputException);

    BOOST_CHECK(registry.empty());
}

BOOST_AUTO_TEST_CASE(checkRegistrationsAreLogged)
{
    std::ostringstream output;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
    sink->set_pattern("%l %v");
    auto logger = std::make_shared<spdlog::logger>("registry", sink);

    Registry logged(DuplicatePolicy::Overwrite, logger);
    logged.registerComponent(repo).registerComponent(otherRepo);

    const std::string text = output.str();
    BOOST_CHECK(text.find("info Registered: fixtures::Repository -> fixtures::Repo") !=
                std::string::npos);
    BOOST_CHECK(text.find("warning Overriding: fixtures::Repository -> fixtures::OtherRepo") !=
                std::string::npos);
}

//----------------------------------------------------------------------------------------------------------------------
BOOST_AUTO_TEST_SUITE_END()
//----------------------------------------------------------------------------------------------------------------------
