#pragma once

#include <pplx/pplxtasks.h>

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <optional>
#include <functional>
#include <exception>

#include "cluster_service.hpp"
#include "cluster_error.hpp"

/**
 * In-memory ClusterService used by the test suites.
 * 
 * Serves a node snapshot and file list, applies toggle / delete commands 
 * to them, and derives file status and reconstruct info with the 
 * HealthEvaluator. Failures and slow responses can be injected per call.
 */
class MockClusterService : public ClusterService
{
public:
    MockClusterService(NodeRegistrySnapshot nodes, std::vector<FileRecord> files);

    pplx::task<NodeRegistrySnapshot> fetchNodes() override;
    pplx::task<std::vector<FileRecord>> fetchFiles() override;
    pplx::task<ReportedFileStatus> fetchFileStatus(const std::string &fileId) override;
    pplx::task<ReconstructionInfo> fetchReconstructInfo(const std::string &fileId) override;
    pplx::task<std::vector<unsigned char>> downloadReconstruction(const std::string &fileId) override;
    pplx::task<DeleteReport> deleteFile(const std::string &fileId) override;
    pplx::task<ToggleAck> simulateFailure(const std::string &nodeId) override;
    pplx::task<ToggleAck> restoreNode(const std::string &nodeId) override;
    pplx::task<FailureInfo> fetchFailures() override;

    /* Makes fetchNodes() / fetchFiles() fail with `kind` (nullopt to succeed again) */
    void failNodeFetches(std::optional<ClusterErrorKind> kind);
    void failFileFetches(std::optional<ClusterErrorKind> kind);

    /* Makes toggles of `nodeId` fail with `kind` */
    void failToggles(const std::string &nodeId, ClusterErrorKind kind);

    /**
     * Makes downloads of `fileId` fail with `error`, which need not be 
     * a ClusterError.
     */
    void failDownloads(const std::string &fileId, std::exception_ptr error);

    /* Overrides the status the service reports for `fileId` */
    void reportStatus(const std::string &fileId, ReportedFileStatus status);

    /* Sets the bytes served by a reconstruction of `fileId` */
    void setPayload(const std::string &fileId, std::vector<unsigned char> payload);

    /* Gate id holding back fetchNodes() / fetchFiles() */
    static const char *const FETCHES;

    /**
     * Holds back commands / downloads for `id` (a node or file id, or 
     * FETCHES) until release(id) is called.
     * 
     * A held fetch serves the data as it was when the fetch was issued.
     */
    void hold(const std::string &id);
    void release(const std::string &id);

    /* Removes a node, as if it was deregistered */
    void removeNode(const std::string &nodeId);

    NodeRegistrySnapshot nodes() const;

    /* Call counters */
    uint32_t nodeFetches() const;
    uint32_t fileFetches() const;
    uint32_t toggleCalls() const;
    uint32_t downloadCalls() const;
    uint32_t deleteCalls() const;

private:
    mutable std::mutex mutex;

    NodeRegistrySnapshot nodeSnapshot;
    std::vector<FileRecord> fileList;

    std::optional<ClusterErrorKind> nodeFetchFailure;
    std::optional<ClusterErrorKind> fileFetchFailure;
    std::map<std::string, ClusterErrorKind> toggleFailures;
    std::map<std::string, std::exception_ptr> downloadFailures;
    std::map<std::string, ReportedFileStatus> reportedStatuses;
    std::map<std::string, std::vector<unsigned char>> payloads;
    std::map<std::string, pplx::task_completion_event<void>> gates;
    std::map<std::string, std::string> failureHistory;

    uint32_t numNodeFetches;
    uint32_t numFileFetches;
    uint32_t numToggles;
    uint32_t numDownloads;
    uint32_t numDeletes;

    /* Runs `work` now, or once `id` is released if it is held */
    template<typename T>
    pplx::task<T> gated(const std::string &id, std::function<T()> work);

    /* Resolves to `value` now, or once `id` is released (mutex must be held) */
    template<typename T>
    pplx::task<T> respond(const std::string &id, T value);

    ToggleAck applyToggle(const std::string &nodeId, NodeState target);

    /* Returns the file with the given id, or nullptr (mutex must be held) */
    const FileRecord *findFile(const std::string &fileId) const;
};
