#pragma once

#include <cpprest/json.h>
#include <pplx/pplxtasks.h>

#include <string>
#include <vector>
#include <map>

#include "storage_node.hpp"
#include "file_record.hpp"
#include "health_evaluator.hpp"

using namespace web;

/**
 * Acknowledgement of a simulate-failure / restore command.
 */
struct ToggleAck
{
    /* false if the node was already in the requested state */
    bool changed;

    /* "failed", "already_failed", "online" or "already_online" */
    std::string status;
    std::string message;

    static ToggleAck fromJson(const json::value &obj);
};

/**
 * The service's report of a file deletion.
 */
struct DeleteReport
{
    std::string fileId;
    uint32_t shardsDeleted;
    std::vector<std::string> errors;

    static DeleteReport fromJson(const json::value &obj);
};

/**
 * Nodes currently in simulated failure, and when each failed.
 */
struct FailureInfo
{
    std::vector<std::string> failedNodes;
    uint32_t failureCount;

    /* Mapping is of the form: { node id -> ISO 8601 failure time } */
    std::map<std::string, std::string> failureHistory;

    static FailureInfo fromJson(const json::value &obj);
};

/**
 * Read and command contract of the external node storage and file 
 * catalog services.
 * 
 * NOTE:
 * 
 * Every call is asynchronous. Failures surface as ClusterError 
 * (see cluster_error.hpp) when the returned task is waited on.
 */
class ClusterService
{
public:
    virtual ~ClusterService() = default;

    /* GET /nodes/status */
    virtual pplx::task<NodeRegistrySnapshot> fetchNodes() = 0;

    /* GET /files */
    virtual pplx::task<std::vector<FileRecord>> fetchFiles() = 0;

    /* GET /file/{id}/status */
    virtual pplx::task<ReportedFileStatus> fetchFileStatus(const std::string &fileId) = 0;

    /* GET /file/{id}/reconstruct-info */
    virtual pplx::task<ReconstructionInfo> fetchReconstructInfo(const std::string &fileId) = 0;

    /* GET /file/{id}/reconstruct */
    virtual pplx::task<std::vector<unsigned char>> downloadReconstruction(const std::string &fileId) = 0;

    /* DELETE /file/{id} */
    virtual pplx::task<DeleteReport> deleteFile(const std::string &fileId) = 0;

    /* POST /nodes/{id}/simulate-failure */
    virtual pplx::task<ToggleAck> simulateFailure(const std::string &nodeId) = 0;

    /* POST /nodes/{id}/restore */
    virtual pplx::task<ToggleAck> restoreNode(const std::string &nodeId) = 0;

    /* GET /nodes/failures */
    virtual pplx::task<FailureInfo> fetchFailures() = 0;
};

namespace ClusterServiceTests
{
    void testToggleAckFromJson();
    void testDeleteReportFromJson();
    void testFailureInfoFromJson();
    void runAll();
}
