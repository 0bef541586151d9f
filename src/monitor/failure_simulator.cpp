#include <iostream>
#include <functional>
#include <map>
#include <set>
#include <mutex>

#include "failure_simulator.hpp"
#include "mock_cluster_service.hpp"
#include "test_utils.hpp"
#include "test_fixtures.hpp"

FailureSimulator::FailureSimulator(ClusterService &service, StateSink applyState)
    : service(service),
      applyState(std::move(applyState))
{
}

pplx::task<ToggleResult> FailureSimulator::simulateFailure(const std::string &nodeId)
{
    return toggle(nodeId, NodeState::SimulatedFailure);
}

pplx::task<ToggleResult> FailureSimulator::restore(const std::string &nodeId)
{
    return toggle(nodeId, NodeState::Online);
}

pplx::task<ToggleResult> FailureSimulator::toggle(const std::string &nodeId, NodeState target)
{
    std::shared_ptr<InFlightRegistry::Guard> guard = inFlight.acquire(nodeId);
    if (!guard)
    {
        return pplx::task_from_result(ToggleResult(
            nodeId, target, CommandOutcome::Rejected, 
            "a command for node " + nodeId + " is already in flight"));
    }

    pplx::task<ToggleAck> request = (target == NodeState::SimulatedFailure)
        ? service.simulateFailure(nodeId)
        : service.restoreNode(nodeId);

    return request.then([this, guard, nodeId, target](pplx::task<ToggleAck> ackTask)
    {
        ToggleResult result(nodeId, target, CommandOutcome::Failed);
        try
        {
            ToggleAck ack = ackTask.get();
            result.message = ack.message;
            result.outcome = ack.changed ? CommandOutcome::Applied : CommandOutcome::AlreadyInState;

            if (!applyState(nodeId, target))
            {
                std::cout << "[simulator] node " << nodeId << " left the snapshot, discarding result" << std::endl;
                result.outcome = CommandOutcome::Stale;
                result.message = "node " + nodeId + " is no longer in the snapshot";
            }
        }
        catch (const ClusterError &e)
        {
            std::cout << "[simulator] " << toString(target) << " of " << nodeId << " failed: " << e.what() << std::endl;
            result.outcome = CommandOutcome::Failed;
            result.errorKind = e.kind();
            result.message = e.what();
        }
        catch (const std::exception &e)
        {
            std::cout << "[simulator] " << toString(target) << " of " << nodeId << " failed: " << e.what() << std::endl;
            result.outcome = CommandOutcome::Failed;
            result.message = e.what();
        }

        guard->release();
        return result;
    });
}

pplx::task<std::vector<ToggleResult>> FailureSimulator::restoreAll()
{
    return service.fetchFailures()
    .then([this](FailureInfo info)
    {
        if (info.failedNodes.empty())
            return pplx::task_from_result(std::vector<ToggleResult>());

        std::vector<pplx::task<ToggleResult>> restoreTasks;
        for (const std::string &nodeId : info.failedNodes)
            restoreTasks.push_back(restore(nodeId));

        return pplx::when_all(restoreTasks.begin(), restoreTasks.end());
    });
}

pplx::task<FailureInfo> FailureSimulator::failureInfo()
{
    return service.fetchFailures();
}

bool FailureSimulator::isInFlight(const std::string &nodeId) const
{
    return inFlight.isInFlight(nodeId);
}

////////////////////////////////////////////
// FailureSimulator tests
////////////////////////////////////////////
namespace FailureSimulatorTests
{
    namespace
    {
        /* Records applied states, knowing only the nodes in `known` */
        struct RecordingSink
        {
            std::mutex mutex;
            std::set<std::string> known;
            std::map<std::string, NodeState> applied;

            FailureSimulator::StateSink sink()
            {
                return [this](const std::string &nodeId, NodeState state)
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (known.find(nodeId) == known.end())
                        return false;
                    applied[nodeId] = state;
                    return true;
                };
            }
        };
    }

    void testToggleIdempotence()
    {
        MockClusterService service(Fixtures::makeNodes(3), {});
        RecordingSink recorder;
        recorder.known = {"node-1", "node-2", "node-3"};
        FailureSimulator simulator(service, recorder.sink());

        ToggleResult first = simulator.simulateFailure("node-2").get();
        ASSERT_THAT(first.outcome == CommandOutcome::Applied);
        ASSERT_THAT(recorder.applied.at("node-2") == NodeState::SimulatedFailure);

        ToggleResult second = simulator.simulateFailure("node-2").get();
        ASSERT_THAT(second.outcome == CommandOutcome::AlreadyInState);
        ASSERT_THAT(second.succeeded());
        ASSERT_THAT(!service.nodes().isOnline("node-2"));

        ToggleResult restored = simulator.restore("node-2").get();
        ASSERT_THAT(restored.outcome == CommandOutcome::Applied);
        ASSERT_THAT(simulator.restore("node-2").get().outcome == CommandOutcome::AlreadyInState);
        ASSERT_THAT(service.nodes().isOnline("node-2"));
    }

    void testConcurrentToggleRejected()
    {
        MockClusterService service(Fixtures::makeNodes(3), {});
        RecordingSink recorder;
        recorder.known = {"node-1", "node-2", "node-3"};
        FailureSimulator simulator(service, recorder.sink());

        service.hold("node-1");
        pplx::task<ToggleResult> pending = simulator.simulateFailure("node-1");
        ASSERT_THAT(simulator.isInFlight("node-1"));

        ToggleResult rejected = simulator.restore("node-1").get();
        ASSERT_THAT(rejected.outcome == CommandOutcome::Rejected);

        service.release("node-1");
        ASSERT_THAT(pending.get().outcome == CommandOutcome::Applied);
        ASSERT_THAT(!simulator.isInFlight("node-1"));
        ASSERT_THAT(service.toggleCalls() == 1);
    }

    void testDifferentNodesConcurrent()
    {
        MockClusterService service(Fixtures::makeNodes(3), {});
        RecordingSink recorder;
        recorder.known = {"node-1", "node-2", "node-3"};
        FailureSimulator simulator(service, recorder.sink());

        service.hold("node-1");
        pplx::task<ToggleResult> held = simulator.simulateFailure("node-1");

        // node-2 completes while node-1 is still in flight
        ToggleResult other = simulator.simulateFailure("node-2").get();
        ASSERT_THAT(other.outcome == CommandOutcome::Applied);
        ASSERT_THAT(simulator.isInFlight("node-1"));

        service.release("node-1");
        ASSERT_THAT(held.get().outcome == CommandOutcome::Applied);
    }

    void testFailedToggleReleasesMarker()
    {
        MockClusterService service(Fixtures::makeNodes(3), {});
        RecordingSink recorder;
        recorder.known = {"node-1", "node-2", "node-3"};
        FailureSimulator simulator(service, recorder.sink());

        service.failToggles("node-3", ClusterErrorKind::Server);
        ToggleResult failed = simulator.simulateFailure("node-3").get();
        ASSERT_THAT(failed.outcome == CommandOutcome::Failed);
        ASSERT_THAT(failed.errorKind == ClusterErrorKind::Server);
        ASSERT_THAT(!simulator.isInFlight("node-3"));
        ASSERT_THAT(recorder.applied.find("node-3") == recorder.applied.end());

        ToggleResult unknown = simulator.simulateFailure("node-9").get();
        ASSERT_THAT(unknown.outcome == CommandOutcome::Failed);
        ASSERT_THAT(unknown.errorKind == ClusterErrorKind::Client);
    }

    void testStaleToggle()
    {
        MockClusterService service(Fixtures::makeNodes(3), {});
        RecordingSink recorder;
        recorder.known = {"node-1", "node-2"};
        FailureSimulator simulator(service, recorder.sink());

        ToggleResult stale = simulator.simulateFailure("node-3").get();
        ASSERT_THAT(stale.outcome == CommandOutcome::Stale);
        ASSERT_THAT(recorder.applied.empty());
        ASSERT_THAT(!simulator.isInFlight("node-3"));
    }

    void testRestoreAll()
    {
        MockClusterService service(Fixtures::makeNodes(4, {"node-2", "node-4"}), {});
        RecordingSink recorder;
        recorder.known = {"node-1", "node-2", "node-3", "node-4"};
        FailureSimulator simulator(service, recorder.sink());

        FailureInfo before = simulator.failureInfo().get();
        ASSERT_THAT(before.failureCount == 2);

        std::vector<ToggleResult> results = simulator.restoreAll().get();
        ASSERT_THAT(results.size() == 2);
        for (const ToggleResult &result : results)
        {
            ASSERT_THAT(result.outcome == CommandOutcome::Applied);
            ASSERT_THAT(recorder.applied.at(result.nodeId) == NodeState::Online);
        }

        ASSERT_THAT(simulator.failureInfo().get().failedNodes.empty());
        ASSERT_THAT(simulator.restoreAll().get().empty());
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "FailureSimulator Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testToggleIdempotence),
            TEST(testConcurrentToggleRejected),
            TEST(testDifferentNodesConcurrent),
            TEST(testFailedToggleReleasesMarker),
            TEST(testStaleToggle),
            TEST(testRestoreAll)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
