#include <cpprest/json.h>

#include <iostream>
#include <functional>

#include "cluster_service.hpp"
#include "utils.hpp"
#include "test_utils.hpp"

using namespace web;

ToggleAck ToggleAck::fromJson(const json::value &obj)
{
    ToggleAck ack;
    ack.status = ApiUtils::stringField(obj, "status", "");
    ack.message = ApiUtils::stringField(obj, "message", "");

    if (ack.status == "failed" || ack.status == "online")
        ack.changed = true;
    else if (ack.status == "already_failed" || ack.status == "already_online")
        ack.changed = false;
    else
        throw std::runtime_error("unexpected toggle status '" + ack.status + "'");

    return ack;
}

DeleteReport DeleteReport::fromJson(const json::value &obj)
{
    if (!obj.is_object())
        throw std::runtime_error("delete response is not an object");

    DeleteReport report;
    report.fileId = ApiUtils::stringField(obj, "file_id", "");
    report.shardsDeleted = static_cast<uint32_t>(ApiUtils::intField(obj, "shards_deleted", 0));

    // `errors` is null when there were none
    if (obj.has_array_field(U("errors")))
    {
        for (const auto &error : obj.at(U("errors")).as_array())
            report.errors.push_back(error.is_string() ? error.as_string() : error.serialize());
    }
    return report;
}

FailureInfo FailureInfo::fromJson(const json::value &obj)
{
    if (!obj.is_object())
        throw std::runtime_error("failure info response is not an object");

    FailureInfo info;
    if (obj.has_array_field(U("failed_nodes")))
    {
        for (const auto &nodeId : obj.at(U("failed_nodes")).as_array())
        {
            if (nodeId.is_string())
                info.failedNodes.push_back(nodeId.as_string());
        }
    }

    info.failureCount = static_cast<uint32_t>(
        ApiUtils::intField(obj, "failure_count", static_cast<int64_t>(info.failedNodes.size())));

    if (obj.has_object_field(U("failure_history")))
    {
        for (const auto &entry : obj.at(U("failure_history")).as_object())
        {
            if (entry.second.is_string())
                info.failureHistory[entry.first] = entry.second.as_string();
        }
    }
    return info;
}

////////////////////////////////////////////
// ClusterService payload tests
////////////////////////////////////////////
namespace ClusterServiceTests
{
    void testToggleAckFromJson()
    {
        ToggleAck failed = ToggleAck::fromJson(json::value::parse(
            "{\"message\": \"Node node-1 failure simulated\", \"status\": \"failed\"}"));
        ASSERT_THAT(failed.changed);
        ASSERT_THAT(failed.message == "Node node-1 failure simulated");

        ToggleAck already = ToggleAck::fromJson(json::value::parse(
            "{\"message\": \"Node node-1 was not failed\", \"status\": \"already_online\"}"));
        ASSERT_THAT(!already.changed);

        bool threw = false;
        try
        {
            ToggleAck::fromJson(json::value::parse("{\"status\": \"exploded\"}"));
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        ASSERT_THAT(threw);
    }

    void testDeleteReportFromJson()
    {
        DeleteReport clean = DeleteReport::fromJson(json::value::parse(
            "{\"file_id\": \"f1\", \"status\": \"deleted\", \"shards_deleted\": 5, \"errors\": null}"));
        ASSERT_THAT(clean.fileId == "f1");
        ASSERT_THAT(clean.shardsDeleted == 5);
        ASSERT_THAT(clean.errors.empty());

        DeleteReport partial = DeleteReport::fromJson(json::value::parse(
            "{\"file_id\": \"f2\", \"shards_deleted\": 4, \"errors\": [\"Failed to delete shard f2_shard_3\"]}"));
        ASSERT_THAT(partial.errors.size() == 1);
        ASSERT_THAT(partial.errors[0] == "Failed to delete shard f2_shard_3");
    }

    void testFailureInfoFromJson()
    {
        FailureInfo info = FailureInfo::fromJson(json::value::parse(
            "{\"failed_nodes\": [\"node-2\", \"node-4\"], \"failure_count\": 2,"
            " \"failure_history\": {\"node-2\": \"2024-05-01T10:00:00\", \"node-4\": \"2024-05-01T10:05:00\"}}"));
        ASSERT_THAT(info.failedNodes.size() == 2);
        ASSERT_THAT(info.failureCount == 2);
        ASSERT_THAT(info.failureHistory.at("node-4") == "2024-05-01T10:05:00");

        FailureInfo none = FailureInfo::fromJson(json::value::parse("{}"));
        ASSERT_THAT(none.failedNodes.empty());
        ASSERT_THAT(none.failureCount == 0);
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "ClusterService Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testToggleAckFromJson),
            TEST(testDeleteReportFromJson),
            TEST(testFailureInfoFromJson)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
