#pragma once

#include <pplx/pplxtasks.h>

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <optional>
#include <functional>

#include "cluster_service.hpp"
#include "cluster_error.hpp"
#include "cluster_health.hpp"
#include "health_evaluator.hpp"
#include "failure_simulator.hpp"
#include "reconstruction.hpp"
#include "commands.hpp"
#include "in_flight.hpp"

/**
 * Latest nodes/files pair fetched by a poll.
 * 
 * NOTE:
 * 
 * Snapshots are immutable once published - a poll or a committed command 
 * publishes a new one in place of the old (last write wins).
 */
struct ClusterSnapshot
{
    NodeRegistrySnapshot nodes;
    std::vector<FileRecord> files;

    /* false if the half couldn't be fetched (its content is then the empty default) */
    bool nodesAvailable;
    bool filesAvailable;

    /* incremented on every publish */
    uint64_t generation;

    ClusterSnapshot();

    /* Returns the file with the given id, or nullptr */
    const FileRecord *findFile(const std::string &fileId) const;
};

/**
 * Outcome of a single poll.
 */
struct PollReport
{
    bool nodesOk;
    bool filesOk;

    /* one error per failed fetch, PartialData if the other fetch succeeded */
    std::vector<ClusterError> errors;

    /* generation of the snapshot the poll published */
    uint64_t generation;

    PollReport();

    bool ok() const { return nodesOk && filesOk; }
    bool partial() const { return nodesOk != filesOk; }
};

/**
 * A file paired with its status as derived from the current snapshot.
 */
struct FileView
{
    FileRecord file;
    FileHealthStatus status;
};

/**
 * Owns the latest cluster snapshot, the polling task and the entry points
 * for operator commands.
 * 
 * NOTE:
 * 
 * File statuses are never cached: every read evaluates the current 
 * snapshot, so a committed toggle is reflected on the next read.
 */
class MonitorSession
{
public:
    MonitorSession(ClusterService &service, uint32_t pollPeriodMs, std::string downloadDirPath);

    /* Stops polling */
    ~MonitorSession();

    MonitorSession(const MonitorSession &) = delete;
    MonitorSession &operator=(const MonitorSession &) = delete;

    /**
     * Fetches nodes and files in parallel and publishes the result.
     * 
     * A failed fetch degrades to its empty default and never prevents the
     * other half from being published.
     */
    PollReport poll();

    /**
     * Starts polling every `pollPeriodMs` on a background thread, with a 
     * first poll straight away. No-op if already polling.
     */
    void startPolling();

    /* Stops the polling thread, waiting for an in-progress poll to finish */
    void stopPolling();

    bool isPolling() const;

    /* Report of the most recent poll */
    PollReport lastPollReport() const;

    std::shared_ptr<const ClusterSnapshot> snapshot() const;

    /**
     * Status of `fileId` in the current snapshot, or nullopt if the 
     * snapshot doesn't contain the file.
     */
    std::optional<FileHealthStatus> fileStatus(const std::string &fileId) const;

    /* Every file of the current snapshot with its status */
    std::vector<FileView> fileStatuses() const;

    ClusterHealthSummary clusterSummary() const;
    ClusterUsage clusterUsage() const;

    /**
     * Compares our derived status of `fileId` with the service's own.
     * 
     * Fails with a Client ClusterError if the file isn't in the snapshot.
     */
    pplx::task<ConsistencyReport> verifyFileStatus(const std::string &fileId);

    pplx::task<ToggleResult> simulateFailure(const std::string &nodeId);
    pplx::task<ToggleResult> restore(const std::string &nodeId);
    pplx::task<std::vector<ToggleResult>> restoreAll();
    pplx::task<FailureInfo> failureInfo();

    pplx::task<ReconstructionResult> reconstruct(
        const std::string &fileId, 
        ReconstructionOrchestrator::Confirmation confirm
    );
    ReconstructionState reconstructionState(const std::string &fileId) const;

    /**
     * Deletes `fileId` from the catalog. On success the file is dropped 
     * from the snapshot.
     */
    pplx::task<DeleteResult> deleteFile(const std::string &fileId);

private:
    ClusterService &service;
    uint32_t pollPeriodMs;

    mutable std::mutex snapshotMutex;
    std::shared_ptr<const ClusterSnapshot> current;
    PollReport lastReport;

    /**
     * Edits published while a poll was in flight, with the generation each
     * one published. A poll replays the ones newer than its start on top of
     * what it fetched. Cleared once no poll is in flight.
     */
    std::vector<std::pair<uint64_t, std::function<bool(ClusterSnapshot &)>>> committedEdits;
    uint32_t pollsInFlight;

    /* in-flight markers for file operations (reconstruct, delete) */
    InFlightRegistry fileOps;

    FailureSimulator simulator;
    ReconstructionOrchestrator orchestrator;

    /* polling thread */
    std::thread poller;
    mutable std::mutex pollMutex;
    std::condition_variable pollCv;
    bool stopRequested;

    void pollLoop();

    /**
     * Publishes a copy of the current snapshot with `edit` applied.
     * 
     * Returns false (and publishes nothing) if `edit` returns false. 
     * `edit` must own what it captures, as an in-flight poll may replay it.
     */
    bool editSnapshot(const std::function<bool(ClusterSnapshot &)> &edit);

    /**
     * Records a committed node state. Returns false if the node isn't 
     * in the snapshot.
     */
    bool applyNodeState(const std::string &nodeId, NodeState state);
};

namespace MonitorSessionTests
{
    void testPoll();
    void testPartialPoll();
    void testPollReplacesSnapshot();
    void testToggleRecomputesStatus();
    void testStaleToggleDiscarded();
    void testVerifyFileStatus();
    void testDeleteFile();
    void testDeleteSerializedWithReconstruct();
    void testPollingLifecycle();
    void testDeleteSurvivesInFlightPoll();
    void testToggleSurvivesInFlightPoll();
    void runAll();
}
