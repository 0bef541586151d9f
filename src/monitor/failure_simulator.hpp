#pragma once

#include <pplx/pplxtasks.h>

#include <string>
#include <vector>
#include <functional>

#include "cluster_service.hpp"
#include "commands.hpp"
#include "in_flight.hpp"

/**
 * Issues simulate-failure / restore commands against the node registry.
 * 
 * NOTE:
 * 
 * At most one command per node id is in flight at a time; commands for 
 * different nodes run concurrently. Once the service commits a change, 
 * the new state is handed to `applyState`, which returns false if the 
 * node is no longer known locally (the result is then reported Stale).
 */
class FailureSimulator
{
public:
    using StateSink = std::function<bool(const std::string &nodeId, NodeState state)>;

    FailureSimulator(ClusterService &service, StateSink applyState);

    pplx::task<ToggleResult> simulateFailure(const std::string &nodeId);
    pplx::task<ToggleResult> restore(const std::string &nodeId);

    /* Drives `nodeId` to `target`, whichever command that takes */
    pplx::task<ToggleResult> toggle(const std::string &nodeId, NodeState target);

    /**
     * Restores every node the registry reports in simulated failure, each
     * through the normal per-node command.
     */
    pplx::task<std::vector<ToggleResult>> restoreAll();

    /* Registry's current failure list and history */
    pplx::task<FailureInfo> failureInfo();

    bool isInFlight(const std::string &nodeId) const;

private:
    ClusterService &service;
    StateSink applyState;
    InFlightRegistry inFlight;
};

namespace FailureSimulatorTests
{
    void testToggleIdempotence();
    void testConcurrentToggleRejected();
    void testDifferentNodesConcurrent();
    void testFailedToggleReleasesMarker();
    void testStaleToggle();
    void testRestoreAll();
    void runAll();
}
