#pragma once

#include <cpprest/http_client.h>
#include <cpprest/json.h>

#include <memory>
#include <functional>
#include <string>

#include "cluster_service.hpp"

using namespace web;
using namespace web::http;
using namespace web::http::client;

/**
 * ClusterService backed by the node registry / file catalog REST API.
 * 
 * NOTE:
 * 
 * Every request carries the configured timeout. Transport failures, 
 * timeouts, error statuses and undecodable bodies are all rethrown 
 * as ClusterError.
 */
class HttpClusterService : public ClusterService
{
public:
    HttpClusterService(
        const std::string &serviceUrl, 
        uint32_t requestTimeoutMs, 
        uint64_t defaultNodeCapacityBytes
    );

    pplx::task<NodeRegistrySnapshot> fetchNodes() override;
    pplx::task<std::vector<FileRecord>> fetchFiles() override;
    pplx::task<ReportedFileStatus> fetchFileStatus(const std::string &fileId) override;
    pplx::task<ReconstructionInfo> fetchReconstructInfo(const std::string &fileId) override;
    pplx::task<std::vector<unsigned char>> downloadReconstruction(const std::string &fileId) override;
    pplx::task<DeleteReport> deleteFile(const std::string &fileId) override;
    pplx::task<ToggleAck> simulateFailure(const std::string &nodeId) override;
    pplx::task<ToggleAck> restoreNode(const std::string &nodeId) override;
    pplx::task<FailureInfo> fetchFailures() override;

private:
    std::shared_ptr<http_client> client;
    uint64_t defaultCapacityBytes;

    /**
     * Sends a request to `path`, resolving to the response iff its 
     * status is 2xx.
     */
    pplx::task<http_response> send(const method &verb, const std::string &path);

    /**
     * Sends a request to `path` and decodes the JSON body with `decode`.
     * 
     * `what` names the response in error messages.
     */
    template<typename T>
    pplx::task<T> sendJson(
        const method &verb, 
        const std::string &path, 
        const std::string &what,
        std::function<T(const json::value &)> decode
    );
};

namespace HttpClusterServiceTests
{
    void testUnreachableService();
    void testDecodesServedResponses();
    void testErrorStatuses();
    void testSlowReplyTimesOut();
    void runAll();
}
