#include <iostream>
#include <functional>
#include <algorithm>
#include <chrono>

#include "monitor_session.hpp"
#include "mock_cluster_service.hpp"
#include "test_utils.hpp"
#include "test_fixtures.hpp"

////////////////////////////////////////////
// ClusterSnapshot / PollReport methods
////////////////////////////////////////////

ClusterSnapshot::ClusterSnapshot()
    : nodesAvailable(false),
      filesAvailable(false),
      generation(0)
{
}

const FileRecord *ClusterSnapshot::findFile(const std::string &fileId) const
{
    for (const FileRecord &file : files)
    {
        if (file.id == fileId)
            return &file;
    }
    return nullptr;
}

PollReport::PollReport()
    : nodesOk(false),
      filesOk(false),
      generation(0)
{
}

////////////////////////////////////////////
// MonitorSession methods
////////////////////////////////////////////

MonitorSession::MonitorSession(ClusterService &service, uint32_t pollPeriodMs, std::string downloadDirPath)
    : service(service),
      pollPeriodMs(pollPeriodMs),
      current(std::make_shared<ClusterSnapshot>()),
      lastReport(),
      pollsInFlight(0),
      fileOps(),
      simulator(service, [this](const std::string &nodeId, NodeState state) 
      { 
          return applyNodeState(nodeId, state); 
      }),
      orchestrator(service, fileOps, downloadDirPath),
      stopRequested(false)
{
}

MonitorSession::~MonitorSession()
{
    stopPolling();
}

PollReport MonitorSession::poll()
{
    uint64_t startGeneration;
    {
        std::lock_guard<std::mutex> lock(snapshotMutex);
        startGeneration = current->generation;
        pollsInFlight++;
    }

    // both fetches are in flight before we wait on either
    pplx::task<NodeRegistrySnapshot> nodesTask = service.fetchNodes();
    pplx::task<std::vector<FileRecord>> filesTask = service.fetchFiles();

    auto next = std::make_shared<ClusterSnapshot>();
    PollReport report;
    std::optional<ClusterError> nodesError;
    std::optional<ClusterError> filesError;

    try
    {
        next->nodes = nodesTask.get();
        report.nodesOk = true;
    }
    catch (const ClusterError &e)
    {
        nodesError = e;
    }
    catch (const std::exception &e)
    {
        nodesError = ClusterError(ClusterErrorKind::Server, "node registry fetch failed: " + std::string(e.what()));
    }

    try
    {
        next->files = filesTask.get();
        report.filesOk = true;
    }
    catch (const ClusterError &e)
    {
        filesError = e;
    }
    catch (const std::exception &e)
    {
        filesError = ClusterError(ClusterErrorKind::Server, "file catalog fetch failed: " + std::string(e.what()));
    }

    next->nodesAvailable = report.nodesOk;
    next->filesAvailable = report.filesOk;

    // a half that failed while the other succeeded is partial data
    auto record = [&report](const ClusterError &error, const std::string &what)
    {
        if (report.partial())
        {
            report.errors.emplace_back(
                ClusterErrorKind::PartialData, 
                what + " unavailable (" + toString(error.kind()) + "): " + error.what(), 
                error.statusCode());
        }
        else
        {
            report.errors.push_back(error);
        }
    };
    if (nodesError)
        record(*nodesError, "node registry");
    if (filesError)
        record(*filesError, "file catalog");

    {
        std::lock_guard<std::mutex> lock(snapshotMutex);

        // commands committed after the fetches went out are newer than what they returned
        for (const auto &[generation, edit] : committedEdits)
        {
            if (generation > startGeneration)
                edit(*next);
        }
        if (--pollsInFlight == 0)
            committedEdits.clear();

        next->generation = current->generation + 1;
        report.generation = next->generation;
        current = next;
        lastReport = report;
    }

    for (const ClusterError &error : report.errors)
        std::cout << "[poll] " << toString(error.kind()) << ": " << error.what() << std::endl;

    std::cout << "[poll] generation " << report.generation << ": " 
              << next->nodes.nodes.size() << " nodes, " 
              << next->files.size() << " files" << std::endl;

    return report;
}

void MonitorSession::startPolling()
{
    std::lock_guard<std::mutex> lock(pollMutex);
    if (poller.joinable())
        return;

    stopRequested = false;
    poller = std::thread(&MonitorSession::pollLoop, this);
}

void MonitorSession::stopPolling()
{
    {
        std::lock_guard<std::mutex> lock(pollMutex);
        stopRequested = true;
    }
    pollCv.notify_all();

    if (poller.joinable())
        poller.join();
}

bool MonitorSession::isPolling() const
{
    std::lock_guard<std::mutex> lock(pollMutex);
    return poller.joinable() && !stopRequested;
}

void MonitorSession::pollLoop()
{
    std::unique_lock<std::mutex> lock(pollMutex);
    while (!stopRequested)
    {
        lock.unlock();
        try
        {
            poll();
        }
        catch (const std::exception &e)
        {
            // retried on the next tick
            std::cout << "[poll] poll failed: " << e.what() << std::endl;
        }
        lock.lock();

        pollCv.wait_for(lock, std::chrono::milliseconds(pollPeriodMs), [this] { return stopRequested; });
    }
}

PollReport MonitorSession::lastPollReport() const
{
    std::lock_guard<std::mutex> lock(snapshotMutex);
    return lastReport;
}

std::shared_ptr<const ClusterSnapshot> MonitorSession::snapshot() const
{
    std::lock_guard<std::mutex> lock(snapshotMutex);
    return current;
}

std::optional<FileHealthStatus> MonitorSession::fileStatus(const std::string &fileId) const
{
    std::shared_ptr<const ClusterSnapshot> snap = snapshot();
    const FileRecord *file = snap->findFile(fileId);
    if (!file)
        return std::nullopt;
    return HealthEvaluator::evaluate(*file, snap->nodes);
}

std::vector<FileView> MonitorSession::fileStatuses() const
{
    std::shared_ptr<const ClusterSnapshot> snap = snapshot();

    std::vector<FileView> views;
    for (const FileRecord &file : snap->files)
        views.push_back({file, HealthEvaluator::evaluate(file, snap->nodes)});
    return views;
}

ClusterHealthSummary MonitorSession::clusterSummary() const
{
    return ClusterHealth::summarize(snapshot()->nodes);
}

ClusterUsage MonitorSession::clusterUsage() const
{
    std::shared_ptr<const ClusterSnapshot> snap = snapshot();
    return ClusterHealth::usage(snap->nodes, snap->files);
}

pplx::task<ConsistencyReport> MonitorSession::verifyFileStatus(const std::string &fileId)
{
    std::optional<FileHealthStatus> local = fileStatus(fileId);
    if (!local)
    {
        return pplx::task_from_exception<ConsistencyReport>(ClusterError(
            ClusterErrorKind::Client, "file " + fileId + " is not in the current snapshot"));
    }

    FileHealthStatus status = *local;
    return service.fetchFileStatus(fileId)
    .then([fileId, status](ReportedFileStatus reported)
    {
        return HealthEvaluator::compare(fileId, status, reported);
    });
}

pplx::task<ToggleResult> MonitorSession::simulateFailure(const std::string &nodeId)
{
    return simulator.simulateFailure(nodeId);
}

pplx::task<ToggleResult> MonitorSession::restore(const std::string &nodeId)
{
    return simulator.restore(nodeId);
}

pplx::task<std::vector<ToggleResult>> MonitorSession::restoreAll()
{
    return simulator.restoreAll();
}

pplx::task<FailureInfo> MonitorSession::failureInfo()
{
    return simulator.failureInfo();
}

pplx::task<ReconstructionResult> MonitorSession::reconstruct(
    const std::string &fileId, 
    ReconstructionOrchestrator::Confirmation confirm
)
{
    return orchestrator.reconstruct(fileId, confirm);
}

ReconstructionState MonitorSession::reconstructionState(const std::string &fileId) const
{
    return orchestrator.state(fileId);
}

pplx::task<DeleteResult> MonitorSession::deleteFile(const std::string &fileId)
{
    std::shared_ptr<InFlightRegistry::Guard> guard = fileOps.acquire(fileId);
    if (!guard)
    {
        return pplx::task_from_result(DeleteResult(
            fileId, CommandOutcome::Rejected, 
            "an operation on file " + fileId + " is already in flight"));
    }

    return service.deleteFile(fileId)
    .then([this, guard, fileId](pplx::task<DeleteReport> reportTask)
    {
        DeleteResult result(fileId, CommandOutcome::Failed);
        try
        {
            DeleteReport report = reportTask.get();
            result.outcome = CommandOutcome::Applied;
            result.shardsDeleted = report.shardsDeleted;
            result.shardErrors = report.errors;
            result.message = "deleted " + std::to_string(report.shardsDeleted) + " shards of " + fileId;

            editSnapshot([fileId](ClusterSnapshot &snap)
            {
                auto it = std::remove_if(snap.files.begin(), snap.files.end(), 
                    [&fileId](const FileRecord &file) { return file.id == fileId; });
                if (it == snap.files.end())
                    return false;
                snap.files.erase(it, snap.files.end());
                return true;
            });
        }
        catch (const ClusterError &e)
        {
            std::cout << "[session] delete of " << fileId << " failed: " << e.what() << std::endl;
            result.errorKind = e.kind();
            result.message = e.what();
        }
        catch (const std::exception &e)
        {
            std::cout << "[session] delete of " << fileId << " failed: " << e.what() << std::endl;
            result.message = e.what();
        }

        guard->release();
        return result;
    });
}

bool MonitorSession::editSnapshot(const std::function<bool(ClusterSnapshot &)> &edit)
{
    std::lock_guard<std::mutex> lock(snapshotMutex);

    auto next = std::make_shared<ClusterSnapshot>(*current);
    if (!edit(*next))
        return false;

    next->generation = current->generation + 1;
    current = next;

    if (pollsInFlight > 0)
        committedEdits.emplace_back(next->generation, edit);
    return true;
}

bool MonitorSession::applyNodeState(const std::string &nodeId, NodeState state)
{
    return editSnapshot([nodeId, state](ClusterSnapshot &snap)
    {
        auto it = snap.nodes.nodes.find(nodeId);
        if (it == snap.nodes.nodes.end())
            return false;

        StorageNode &node = it->second;
        if (node.state != state)
        {
            if (state == NodeState::Online)
                snap.nodes.reportedOnlineNodes++;
            else if (snap.nodes.reportedOnlineNodes > 0)
                snap.nodes.reportedOnlineNodes--;
        }

        node.state = state;
        node.simulatedFailure = (state == NodeState::SimulatedFailure);
        return true;
    });
}

////////////////////////////////////////////
// MonitorSession tests
////////////////////////////////////////////
namespace MonitorSessionTests
{
    namespace
    {
        std::vector<FileRecord> sampleFiles()
        {
            return {
                Fixtures::makeSpreadFile("rs", ReedSolomon{3, 2}),
                Fixtures::makeSpreadFile("rep", Replication{3})
            };
        }

        std::string scratchDir(const std::string &name)
        {
            fs::path dir = fs::temp_directory_path() / ("shardwatch_session_" + name);
            fs::remove_all(dir);
            return dir.string();
        }
    }

    void testPoll()
    {
        MockClusterService service(Fixtures::makeNodes(5, {"node-4"}), sampleFiles());
        MonitorSession session(service, 10000, scratchDir("poll"));

        ASSERT_THAT(session.snapshot()->generation == 0);
        ASSERT_THAT(!session.fileStatus("rs").has_value());

        PollReport report = session.poll();
        ASSERT_THAT(report.ok());
        ASSERT_THAT(report.errors.empty());
        ASSERT_THAT(report.generation == 1);

        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Degraded);
        ASSERT_THAT(session.fileStatus("rep")->health == FileHealth::Healthy);
        ASSERT_THAT(session.fileStatuses().size() == 2);

        ClusterHealthSummary summary = session.clusterSummary();
        ASSERT_THAT(summary.offlineNodes == 1);
        ASSERT_THAT(summary.healthLabel == "Warning");
        ASSERT_THAT(session.clusterUsage().totalFiles == 2);
    }

    void testPartialPoll()
    {
        MockClusterService service(Fixtures::makeNodes(5), sampleFiles());
        MonitorSession session(service, 10000, scratchDir("partial"));

        service.failFileFetches(ClusterErrorKind::Connection);
        PollReport filesDown = session.poll();
        ASSERT_THAT(filesDown.partial());
        ASSERT_THAT(filesDown.errors.size() == 1);
        ASSERT_THAT(filesDown.errors[0].kind() == ClusterErrorKind::PartialData);
        ASSERT_THAT(session.snapshot()->nodes.nodes.size() == 5);
        ASSERT_THAT(session.snapshot()->files.empty());
        ASSERT_THAT(!session.snapshot()->filesAvailable);

        service.failFileFetches(std::nullopt);
        service.failNodeFetches(ClusterErrorKind::Timeout);
        PollReport nodesDown = session.poll();
        ASSERT_THAT(nodesDown.partial());
        ASSERT_THAT(session.snapshot()->nodes.nodes.empty());
        ASSERT_THAT(session.snapshot()->files.size() == 2);

        // no node known online - every shard counts as offline
        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Critical);

        service.failFileFetches(ClusterErrorKind::Server);
        PollReport bothDown = session.poll();
        ASSERT_THAT(!bothDown.partial());
        ASSERT_THAT(bothDown.errors.size() == 2);
        ASSERT_THAT(bothDown.errors[0].kind() == ClusterErrorKind::Timeout);
        ASSERT_THAT(bothDown.errors[1].kind() == ClusterErrorKind::Server);
    }

    void testPollReplacesSnapshot()
    {
        MockClusterService service(Fixtures::makeNodes(5), sampleFiles());
        MonitorSession session(service, 10000, scratchDir("replace"));

        session.poll();
        ASSERT_THAT(session.snapshot()->nodes.find("node-3") != nullptr);

        service.removeNode("node-3");
        session.poll();
        ASSERT_THAT(session.snapshot()->nodes.find("node-3") == nullptr);
        ASSERT_THAT(session.snapshot()->generation == 2);
        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Degraded);
    }

    void testToggleRecomputesStatus()
    {
        MockClusterService service(Fixtures::makeNodes(5), sampleFiles());
        MonitorSession session(service, 10000, scratchDir("toggle"));
        session.poll();

        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Healthy);

        ToggleResult failed = session.simulateFailure("node-1").get();
        ASSERT_THAT(failed.outcome == CommandOutcome::Applied);

        // reflected without waiting for the next poll
        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Degraded);
        ASSERT_THAT(session.fileStatus("rs")->canSurviveMore == 1);
        ASSERT_THAT(session.clusterSummary().healthLabel == "Warning");

        session.simulateFailure("node-2").get();
        session.simulateFailure("node-3").get();
        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Critical);
        ASSERT_THAT(session.fileStatus("rep")->health == FileHealth::Critical);

        std::vector<ToggleResult> restored = session.restoreAll().get();
        ASSERT_THAT(restored.size() == 3);
        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Healthy);
        ASSERT_THAT(session.clusterSummary().healthLabel == "Excellent");
    }

    void testStaleToggleDiscarded()
    {
        MockClusterService service(Fixtures::makeNodes(3), {});
        MonitorSession session(service, 10000, scratchDir("stale"));

        service.failNodeFetches(ClusterErrorKind::Connection);
        session.poll();
        uint64_t generation = session.snapshot()->generation;

        ToggleResult stale = session.simulateFailure("node-1").get();
        ASSERT_THAT(stale.outcome == CommandOutcome::Stale);
        ASSERT_THAT(session.snapshot()->generation == generation);
        ASSERT_THAT(session.snapshot()->nodes.nodes.empty());
    }

    void testVerifyFileStatus()
    {
        MockClusterService service(Fixtures::makeNodes(5, {"node-2"}), sampleFiles());
        MonitorSession session(service, 10000, scratchDir("verify"));
        session.poll();

        ASSERT_THAT(session.verifyFileStatus("rs").get().consistent());

        ReportedFileStatus disagreeing;
        disagreeing.onlineShards = 5;
        disagreeing.neededShards = 3;
        disagreeing.reconstructable = true;
        disagreeing.health = "healthy";
        service.reportStatus("rs", disagreeing);

        ConsistencyReport report = session.verifyFileStatus("rs").get();
        ASSERT_THAT(!report.consistent());
        ASSERT_THAT(report.mismatches[0] == "online_shards: local 4, service 5");

        bool threw = false;
        try
        {
            session.verifyFileStatus("ghost").get();
        }
        catch (const ClusterError &e)
        {
            threw = true;
            ASSERT_THAT(e.kind() == ClusterErrorKind::Client);
        }
        ASSERT_THAT(threw);
    }

    void testDeleteFile()
    {
        MockClusterService service(Fixtures::makeNodes(5), sampleFiles());
        MonitorSession session(service, 10000, scratchDir("delete"));
        session.poll();

        DeleteResult deleted = session.deleteFile("rs").get();
        ASSERT_THAT(deleted.outcome == CommandOutcome::Applied);
        ASSERT_THAT(deleted.shardsDeleted == 5);
        ASSERT_THAT(session.snapshot()->findFile("rs") == nullptr);
        ASSERT_THAT(!session.fileStatus("rs").has_value());
        ASSERT_THAT(session.fileStatuses().size() == 1);

        DeleteResult again = session.deleteFile("rs").get();
        ASSERT_THAT(again.outcome == CommandOutcome::Failed);
        ASSERT_THAT(again.errorKind == ClusterErrorKind::Client);

        // marker was released after the failure, so a retry goes through to the service
        session.deleteFile("rs").get();
        ASSERT_THAT(service.deleteCalls() == 3);
    }

    void testDeleteSerializedWithReconstruct()
    {
        MockClusterService service(Fixtures::makeNodes(5), sampleFiles());
        std::string dir = scratchDir("serialized");
        MonitorSession session(service, 10000, dir);
        session.poll();

        service.hold("rep");
        pplx::task<ReconstructionResult> pending = session.reconstruct("rep", [](const ReconstructionInfo &) 
        { 
            return true; 
        });

        DeleteResult rejected = session.deleteFile("rep").get();
        ASSERT_THAT(rejected.outcome == CommandOutcome::Rejected);
        ASSERT_THAT(service.deleteCalls() == 0);

        service.release("rep");
        ASSERT_THAT(pending.get().state == ReconstructionState::Saved);
        ASSERT_THAT(session.reconstructionState("rep") == ReconstructionState::Saved);

        ASSERT_THAT(session.deleteFile("rep").get().outcome == CommandOutcome::Applied);
        fs::remove_all(dir);
    }

    void testPollingLifecycle()
    {
        MockClusterService service(Fixtures::makeNodes(3), {});
        MonitorSession session(service, 20, scratchDir("lifecycle"));

        session.startPolling();
        ASSERT_THAT(session.isPolling());

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (service.nodeFetches() < 3 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        ASSERT_THAT(service.nodeFetches() >= 3);

        session.stopPolling();
        ASSERT_THAT(!session.isPolling());

        uint32_t fetches = service.nodeFetches();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ASSERT_THAT(service.nodeFetches() == fetches);
    }

    namespace
    {
        /* Waits until `fetches()` passes `before`, i.e. a poll has issued its fetch */
        bool waitForFetch(const std::function<uint32_t()> &fetches, uint32_t before)
        {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (fetches() == before && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            return fetches() > before;
        }
    }

    void testDeleteSurvivesInFlightPoll()
    {
        MockClusterService service(Fixtures::makeNodes(5), sampleFiles());
        MonitorSession session(service, 10000, scratchDir("delete_in_flight"));
        session.poll();

        // the catalog is fetched with "rs" still in it, then held back
        service.hold(MockClusterService::FETCHES);
        uint32_t before = service.fileFetches();
        pplx::task<PollReport> polling = pplx::create_task([&session]() { return session.poll(); });
        ASSERT_THAT(waitForFetch([&service]() { return service.fileFetches(); }, before));

        ASSERT_THAT(session.deleteFile("rs").get().outcome == CommandOutcome::Applied);
        ASSERT_THAT(session.snapshot()->findFile("rs") == nullptr);

        service.release(MockClusterService::FETCHES);
        PollReport report = polling.get();
        ASSERT_THAT(report.ok());
        ASSERT_THAT(report.generation == 3);

        ASSERT_THAT(session.snapshot()->findFile("rs") == nullptr);
        ASSERT_THAT(session.snapshot()->findFile("rep") != nullptr);
        ASSERT_THAT(session.fileStatuses().size() == 1);

        // the next poll sees the catalog without it
        session.poll();
        ASSERT_THAT(session.snapshot()->findFile("rs") == nullptr);
    }

    void testToggleSurvivesInFlightPoll()
    {
        MockClusterService service(Fixtures::makeNodes(5), sampleFiles());
        MonitorSession session(service, 10000, scratchDir("toggle_in_flight"));
        session.poll();

        service.hold(MockClusterService::FETCHES);
        uint32_t before = service.nodeFetches();
        pplx::task<PollReport> polling = pplx::create_task([&session]() { return session.poll(); });
        ASSERT_THAT(waitForFetch([&service]() { return service.nodeFetches(); }, before));

        ASSERT_THAT(session.simulateFailure("node-1").get().outcome == CommandOutcome::Applied);
        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Degraded);

        service.release(MockClusterService::FETCHES);
        polling.get();

        const StorageNode *node = session.snapshot()->nodes.find("node-1");
        ASSERT_THAT(node != nullptr);
        ASSERT_THAT(node->state == NodeState::SimulatedFailure);
        ASSERT_THAT(session.snapshot()->nodes.reportedOnlineNodes == 4);
        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Degraded);

        // nothing is replayed once no poll is in flight
        service.restoreNode("node-1").get();
        session.poll();
        ASSERT_THAT(session.snapshot()->nodes.find("node-1")->state == NodeState::Online);
        ASSERT_THAT(session.fileStatus("rs")->health == FileHealth::Healthy);
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "MonitorSession Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testPoll),
            TEST(testPartialPoll),
            TEST(testPollReplacesSnapshot),
            TEST(testToggleRecomputesStatus),
            TEST(testStaleToggleDiscarded),
            TEST(testVerifyFileStatus),
            TEST(testDeleteFile),
            TEST(testDeleteSerializedWithReconstruct),
            TEST(testPollingLifecycle),
            TEST(testDeleteSurvivesInFlightPoll),
            TEST(testToggleSurvivesInFlightPoll)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
