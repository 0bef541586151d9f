#include <cpprest/http_client.h>
#include <cpprest/http_listener.h>
#include <cpprest/json.h>

#include <iostream>
#include <system_error>
#include <functional>
#include <map>
#include <thread>
#include <chrono>
#include <optional>

#include "http_cluster_service.hpp"
#include "cluster_error.hpp"
#include "utils.hpp"
#include "test_utils.hpp"
#include "test_fixtures.hpp"

using namespace web;
using namespace web::http;
using namespace web::http::client;
using namespace web::http::experimental::listener;

namespace
{
    /**
     * Maps a transport failure of `what` (no usable response) to a 
     * Timeout or Connection error.
     */
    ClusterError transportError(const http_exception &e, const std::string &what)
    {
        if (e.error_code() == std::errc::timed_out)
            return ClusterError(ClusterErrorKind::Timeout, what + " timed out");

        return ClusterError(ClusterErrorKind::Connection, what + " failed: " + std::string(e.what()));
    }
}

HttpClusterService::HttpClusterService(
    const std::string &serviceUrl, 
    uint32_t requestTimeoutMs, 
    uint64_t defaultNodeCapacityBytes
)
    : defaultCapacityBytes(defaultNodeCapacityBytes)
{
    http_client_config config;
    config.set_timeout(std::chrono::milliseconds(requestTimeoutMs));
    client = std::make_shared<http_client>(U(serviceUrl), config);
}

pplx::task<http_response> HttpClusterService::send(const method &verb, const std::string &path)
{
    http_request request;
    request.set_method(verb);
    request.set_request_uri(U(path));

    return client->request(request)
    .then([=](pplx::task<http_response> responseTask)
    {
        http_response response;
        try
        {
            response = responseTask.get();
        }
        catch (const http_exception &e)
        {
            throw transportError(e, verb + " " + path);
        }

        status_code status = response.status_code();
        if (status >= 200 && status < 300)
            return response;

        std::string body;
        try
        {
            body = response.extract_string(true).get();
        }
        catch (const http_exception &e)
        {
            throw transportError(e, verb + " " + path);
        }

        std::string detail = ApiUtils::errorDetail(body);
        if (detail.empty())
            detail = verb + " " + path + " failed with status: " + std::to_string(status);

        ClusterErrorKind kind = (status >= 400 && status < 500) 
            ? ClusterErrorKind::Client 
            : ClusterErrorKind::Server;
        throw ClusterError(kind, detail, status);
    });
}

template<typename T>
pplx::task<T> HttpClusterService::sendJson(
    const method &verb, 
    const std::string &path, 
    const std::string &what,
    std::function<T(const json::value &)> decode
)
{
    return send(verb, path)
    .then([](http_response response)
    {
        // the service doesn't always label its JSON bodies
        return response.extract_json(true);
    })
    .then([=](pplx::task<json::value> bodyTask)
    {
        try
        {
            return decode(bodyTask.get());
        }
        catch (const ClusterError &)
        {
            throw;
        }
        catch (const http_exception &e)
        {
            throw transportError(e, verb + " " + path);
        }
        catch (const std::exception &e)
        {
            throw ClusterError(
                ClusterErrorKind::Server, 
                "malformed " + what + " response: " + std::string(e.what()));
        }
    });
}

pplx::task<NodeRegistrySnapshot> HttpClusterService::fetchNodes()
{
    uint64_t capacity = defaultCapacityBytes;
    return sendJson<NodeRegistrySnapshot>(
        methods::GET, ApiUtils::buildPath({"nodes", "status"}), "node status",
        [capacity](const json::value &body) { return NodeRegistrySnapshot::fromJson(body, capacity); });
}

pplx::task<std::vector<FileRecord>> HttpClusterService::fetchFiles()
{
    return sendJson<std::vector<FileRecord>>(
        methods::GET, ApiUtils::buildPath({"files"}), "file list",
        [](const json::value &body) { return FileRecord::listFromJson(body); });
}

pplx::task<ReportedFileStatus> HttpClusterService::fetchFileStatus(const std::string &fileId)
{
    return sendJson<ReportedFileStatus>(
        methods::GET, ApiUtils::buildPath({"file", fileId, "status"}), "file status",
        [](const json::value &body) { return ReportedFileStatus::fromJson(body); });
}

pplx::task<ReconstructionInfo> HttpClusterService::fetchReconstructInfo(const std::string &fileId)
{
    return sendJson<ReconstructionInfo>(
        methods::GET, ApiUtils::buildPath({"file", fileId, "reconstruct-info"}), "reconstruct info",
        [](const json::value &body) { return ReconstructionInfo::fromJson(body); });
}

pplx::task<std::vector<unsigned char>> HttpClusterService::downloadReconstruction(const std::string &fileId)
{
    std::string path = ApiUtils::buildPath({"file", fileId, "reconstruct"});

    return send(methods::GET, path)
    .then([](http_response response)
    {
        return response.extract_vector();
    })
    .then([path](pplx::task<std::vector<unsigned char>> payloadTask)
    {
        // the payload can fail mid-transfer after a 2xx status
        try
        {
            return payloadTask.get();
        }
        catch (const http_exception &e)
        {
            throw transportError(e, "GET " + path);
        }
    });
}

pplx::task<DeleteReport> HttpClusterService::deleteFile(const std::string &fileId)
{
    return sendJson<DeleteReport>(
        methods::DEL, ApiUtils::buildPath({"file", fileId}), "delete",
        [](const json::value &body) { return DeleteReport::fromJson(body); });
}

pplx::task<ToggleAck> HttpClusterService::simulateFailure(const std::string &nodeId)
{
    return sendJson<ToggleAck>(
        methods::POST, ApiUtils::buildPath({"nodes", nodeId, "simulate-failure"}), "simulate-failure",
        [](const json::value &body) { return ToggleAck::fromJson(body); });
}

pplx::task<ToggleAck> HttpClusterService::restoreNode(const std::string &nodeId)
{
    return sendJson<ToggleAck>(
        methods::POST, ApiUtils::buildPath({"nodes", nodeId, "restore"}), "restore",
        [](const json::value &body) { return ToggleAck::fromJson(body); });
}

pplx::task<FailureInfo> HttpClusterService::fetchFailures()
{
    return sendJson<FailureInfo>(
        methods::GET, ApiUtils::buildPath({"nodes", "failures"}), "failure info",
        [](const json::value &body) { return FailureInfo::fromJson(body); });
}

////////////////////////////////////////////
// HttpClusterService tests
////////////////////////////////////////////
namespace HttpClusterServiceTests
{
    namespace
    {
        /**
         * Canned reply for one path of a StubServer.
         */
        struct CannedReply
        {
            status_code status;
            std::string body;
            std::string contentType;
            uint32_t delayMs;
        };

        /**
         * Local HTTP server replying to each path with a canned reply,
         * and with 404 to anything else.
         */
        class StubServer
        {
        public:
            StubServer(const std::string &addr, std::map<std::string, CannedReply> replies)
                : listener(U(addr)), 
                  replies(std::move(replies))
            {
                listener.support([this](http_request request) { this->router(request); });
                listener.open().wait();
            }

            ~StubServer()
            {
                try
                {
                    listener.close().wait();
                }
                catch (const std::exception &e)
                {
                    std::cerr << "stub server close failed: " << e.what() << std::endl;
                }
            }

        private:
            http_listener listener;
            std::map<std::string, CannedReply> replies;

            void router(http_request request)
            {
                auto it = replies.find(request.relative_uri().path());
                if (it == replies.end())
                {
                    request.reply(status_codes::NotFound, "{\"detail\": \"Not Found\"}", "application/json");
                    return;
                }

                const CannedReply &reply = it->second;
                if (reply.delayMs > 0)
                    std::this_thread::sleep_for(std::chrono::milliseconds(reply.delayMs));
                request.reply(reply.status, reply.body, reply.contentType);
            }
        };

        CannedReply jsonReply(status_code status, const json::value &body)
        {
            return {status, body.serialize(), "application/json", 0};
        }

        /* Runs `call` and returns the ClusterError it fails with */
        template<typename T>
        std::optional<ClusterError> failureOf(pplx::task<T> call)
        {
            try
            {
                call.get();
            }
            catch (const ClusterError &e)
            {
                return e;
            }
            return std::nullopt;
        }
    }

    void testDecodesServedResponses()
    {
        std::vector<json::value> files = {
            Fixtures::fileJson(Fixtures::makeSpreadFile("rs", ReedSolomon{2, 1})),
            Fixtures::fileJson(Fixtures::makeSpreadFile("rep", Replication{2}))
        };

        StubServer server("http://127.0.0.1:34571", {
            {"/nodes/status", jsonReply(status_codes::OK, Fixtures::nodesJson(Fixtures::makeNodes(3, {"node-2"})))},
            // unlabelled JSON is still decoded
            {"/files", {status_codes::OK, json::value::array(files).serialize(), "text/plain", 0}}
        });
        HttpClusterService service("http://127.0.0.1:34571", 5000, IngestDefaults::NODE_CAPACITY_BYTES);

        NodeRegistrySnapshot nodes = service.fetchNodes().get();
        ASSERT_THAT(nodes.nodes.size() == 3);
        ASSERT_THAT(nodes.reportedOnlineNodes == 2);
        ASSERT_THAT(nodes.isOnline("node-1"));
        ASSERT_THAT(!nodes.isOnline("node-2"));

        std::vector<FileRecord> records = service.fetchFiles().get();
        ASSERT_THAT(records.size() == 2);
        ASSERT_THAT(records[0].id == "rs");
        ASSERT_THAT(records[0].shards.size() == 3);
        ASSERT_THAT(records[0].scheme && std::holds_alternative<ReedSolomon>(*records[0].scheme));
        ASSERT_THAT(records[1].scheme && std::holds_alternative<Replication>(*records[1].scheme));
    }

    void testErrorStatuses()
    {
        json::value notFound;
        notFound[U("detail")] = json::value::string(U("File ghost not found"));
        json::value serverError;
        serverError[U("detail")] = json::value::string(U("Reconstruction failed: insufficient shards"));

        StubServer server("http://127.0.0.1:34572", {
            {"/file/ghost/status", jsonReply(status_codes::NotFound, notFound)},
            {"/file/doc/reconstruct", jsonReply(status_codes::InternalError, serverError)},
            {"/nodes/failures", {status_codes::ServiceUnavailable, "upstream down", "text/plain", 0}},
            {"/files", {status_codes::OK, "<html>not json</html>", "text/html", 0}}
        });
        HttpClusterService service("http://127.0.0.1:34572", 5000, IngestDefaults::NODE_CAPACITY_BYTES);

        std::optional<ClusterError> missing = failureOf(service.fetchFileStatus("ghost"));
        ASSERT_THAT(missing.has_value());
        ASSERT_THAT(missing->kind() == ClusterErrorKind::Client);
        ASSERT_THAT(missing->statusCode() == 404);
        ASSERT_THAT(std::string(missing->what()) == "File ghost not found");

        std::optional<ClusterError> failed = failureOf(service.downloadReconstruction("doc"));
        ASSERT_THAT(failed.has_value());
        ASSERT_THAT(failed->kind() == ClusterErrorKind::Server);
        ASSERT_THAT(failed->statusCode() == 500);
        ASSERT_THAT(std::string(failed->what()) == "Reconstruction failed: insufficient shards");

        // a non-JSON error body is passed through as is
        std::optional<ClusterError> unavailable = failureOf(service.fetchFailures());
        ASSERT_THAT(unavailable.has_value());
        ASSERT_THAT(unavailable->kind() == ClusterErrorKind::Server);
        ASSERT_THAT(unavailable->statusCode() == 503);
        ASSERT_THAT(std::string(unavailable->what()) == "upstream down");

        std::optional<ClusterError> malformed = failureOf(service.fetchFiles());
        ASSERT_THAT(malformed.has_value());
        ASSERT_THAT(malformed->kind() == ClusterErrorKind::Server);
        ASSERT_THAT(std::string(malformed->what()).find("malformed file list response") == 0);
    }

    void testSlowReplyTimesOut()
    {
        StubServer server("http://127.0.0.1:34573", {
            {"/nodes/status", {status_codes::OK, "{}", "application/json", 1500}}
        });
        HttpClusterService service("http://127.0.0.1:34573", 300, IngestDefaults::NODE_CAPACITY_BYTES);

        std::optional<ClusterError> slow = failureOf(service.fetchNodes());
        ASSERT_THAT(slow.has_value());
        ASSERT_THAT(slow->kind() == ClusterErrorKind::Timeout);
        ASSERT_THAT(slow->statusCode() == 0);
    }

    void testUnreachableService()
    {
        // nothing listens on the discard port
        HttpClusterService service("http://127.0.0.1:9", 2000, IngestDefaults::NODE_CAPACITY_BYTES);

        bool threw = false;
        try
        {
            service.fetchNodes().get();
        }
        catch (const ClusterError &e)
        {
            threw = true;
            ASSERT_THAT(e.kind() == ClusterErrorKind::Connection || e.kind() == ClusterErrorKind::Timeout);
            ASSERT_THAT(e.statusCode() == 0);
        }
        ASSERT_THAT(threw);
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "HttpClusterService Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testUnreachableService),
            TEST(testDecodesServedResponses),
            TEST(testErrorStatuses),
            TEST(testSlowReplyTimesOut)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
