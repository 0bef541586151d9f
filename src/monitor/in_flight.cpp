#include <iostream>
#include <functional>
#include <vector>

#include "in_flight.hpp"
#include "test_utils.hpp"

////////////////////////////////////////////
// InFlightRegistry methods
////////////////////////////////////////////

InFlightRegistry::Guard::Guard(InFlightRegistry &registry, std::string id)
    : registry(registry),
      entityId(std::move(id)),
      released(false)
{
}

InFlightRegistry::Guard::~Guard()
{
    release();
}

void InFlightRegistry::Guard::release()
{
    if (released)
        return;
    released = true;
    registry.clear(entityId);
}

std::shared_ptr<InFlightRegistry::Guard> InFlightRegistry::acquire(const std::string &id)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!inFlight.insert(id).second)
            return nullptr;
    }
    return std::make_shared<Guard>(*this, id);
}

bool InFlightRegistry::isInFlight(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex);
    return inFlight.find(id) != inFlight.end();
}

size_t InFlightRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return inFlight.size();
}

void InFlightRegistry::clear(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex);
    inFlight.erase(id);
}

////////////////////////////////////////////
// InFlightRegistry tests
////////////////////////////////////////////
namespace InFlightRegistryTests
{
    void testAcquireRelease()
    {
        InFlightRegistry registry;

        auto first = registry.acquire("node-1");
        ASSERT_THAT(first != nullptr);
        ASSERT_THAT(registry.isInFlight("node-1"));
        ASSERT_THAT(registry.acquire("node-1") == nullptr);

        first.reset();
        ASSERT_THAT(!registry.isInFlight("node-1"));

        auto second = registry.acquire("node-1");
        ASSERT_THAT(second != nullptr);

        // explicit release is idempotent and doesn't clear a later holder's marker
        second->release();
        ASSERT_THAT(!registry.isInFlight("node-1"));
        auto third = registry.acquire("node-1");
        second->release();
        second.reset();
        ASSERT_THAT(registry.isInFlight("node-1"));
        third.reset();
        ASSERT_THAT(!registry.isInFlight("node-1"));
    }

    void testIndependentIds()
    {
        InFlightRegistry registry;

        auto a = registry.acquire("node-1");
        auto b = registry.acquire("node-2");
        ASSERT_THAT(a != nullptr && b != nullptr);
        ASSERT_THAT(registry.size() == 2);
    }

    void testReleasedOnException()
    {
        InFlightRegistry registry;

        try
        {
            auto guard = registry.acquire("file-1");
            throw std::runtime_error("toggle failed");
        }
        catch (const std::runtime_error &)
        {
        }

        ASSERT_THAT(!registry.isInFlight("file-1"));
        ASSERT_THAT(registry.size() == 0);
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "InFlightRegistry Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testAcquireRelease),
            TEST(testIndependentIds),
            TEST(testReleasedOnException)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
