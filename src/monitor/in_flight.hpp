#pragma once

#include <string>
#include <set>
#include <mutex>
#include <memory>

/**
 * Set of entity ids (node ids or file ids) that currently have an
 * operation in flight.
 * 
 * NOTE:
 * 
 * Use InFlightRegistry::acquire(), which returns a guard that clears the 
 * marker on destruction, so the marker can't leak on an error path.
 */
class InFlightRegistry
{
public:
    class Guard
    {
    public:
        Guard(InFlightRegistry &registry, std::string id);
        ~Guard();

        Guard(const Guard &) = delete;
        Guard &operator=(const Guard &) = delete;

        const std::string &id() const { return entityId; }

        /**
         * Clears the marker now rather than on destruction. Idempotent.
         * 
         * NOTE: task continuations call this before returning their result,
         * so a caller that has the result never still sees the marker.
         */
        void release();

    private:
        InFlightRegistry &registry;
        std::string entityId;
        bool released;
    };

    /**
     * Marks `id` as in flight.
     * 
     * Returns a guard owning the marker, or nullptr if `id` is already 
     * in flight. The guard is shared so it can be captured by task 
     * continuations.
     */
    std::shared_ptr<Guard> acquire(const std::string &id);

    bool isInFlight(const std::string &id) const;

    /* Number of ids currently in flight */
    size_t size() const;

private:
    void clear(const std::string &id);

    mutable std::mutex mutex;
    std::set<std::string> inFlight;
};

namespace InFlightRegistryTests
{
    void testAcquireRelease();
    void testIndependentIds();
    void testReleasedOnException();
    void runAll();
}
