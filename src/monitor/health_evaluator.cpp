#include <cpprest/json.h>

#include <iostream>
#include <functional>
#include <algorithm>
#include <set>

#include "health_evaluator.hpp"
#include "utils.hpp"
#include "test_utils.hpp"
#include "test_fixtures.hpp"

using namespace web;

std::string toString(FileHealth health)
{
    switch (health)
    {
        case FileHealth::Healthy:  return "healthy";
        case FileHealth::Degraded: return "degraded";
        case FileHealth::Critical: return "critical";
        case FileHealth::Unknown:  return "unknown";
    }
    return "unknown";
}

////////////////////////////////////////////
// FileHealthStatus methods
////////////////////////////////////////////

FileHealthStatus::FileHealthStatus()
    : onlineShards(0),
      neededShards(0),
      totalShards(0),
      canSurviveMore(0),
      reconstructable(false),
      health(FileHealth::Unknown)
{
}

bool FileHealthStatus::operator==(const FileHealthStatus &other) const
{
    if (shardStatus.size() != other.shardStatus.size())
        return false;

    for (size_t i = 0; i < shardStatus.size(); i++)
    {
        const ShardStatus &a = shardStatus[i];
        const ShardStatus &b = other.shardStatus[i];
        if (a.index != b.index || a.nodeId != b.nodeId || a.online != b.online || a.sizeBytes != b.sizeBytes)
            return false;
    }

    return onlineShards == other.onlineShards
        && neededShards == other.neededShards
        && totalShards == other.totalShards
        && canSurviveMore == other.canSurviveMore
        && reconstructable == other.reconstructable
        && health == other.health
        && missingShardIndices == other.missingShardIndices
        && issue == other.issue;
}

////////////////////////////////////////////
// ReconstructionInfo methods
////////////////////////////////////////////

ReconstructionInfo::ReconstructionInfo()
    : totalShards(0),
      availableShards(0),
      neededShards(0),
      canReconstruct(false),
      originalSizeBytes(0)
{
}

uint32_t ReconstructionInfo::shortfall() const
{
    return availableShards >= neededShards ? 0 : neededShards - availableShards;
}

ReconstructionInfo ReconstructionInfo::fromJson(const json::value &obj)
{
    if (!obj.is_object())
        throw std::runtime_error("reconstruct-info response is not an object");

    ReconstructionInfo info;
    info.fileId = ApiUtils::stringField(obj, "file_id", "");
    info.filename = ApiUtils::stringField(obj, "filename", info.fileId);
    info.totalShards = static_cast<uint32_t>(ApiUtils::intField(obj, "total_shards", 0));
    info.availableShards = static_cast<uint32_t>(ApiUtils::intField(obj, "available_shards", 0));
    info.neededShards = static_cast<uint32_t>(ApiUtils::intField(obj, "needed_shards", 0));
    info.originalSizeBytes = static_cast<uint64_t>(ApiUtils::intField(obj, "original_size", 0));

    if (obj.has_array_field(U("missing_shards")))
    {
        for (const auto &index : obj.at(U("missing_shards")).as_array())
        {
            if (index.is_integer())
                info.missingShardIndices.push_back(static_cast<uint32_t>(index.as_integer()));
        }
    }

    // the orchestrator gates on this, so derive it rather than trusting a missing field
    info.canReconstruct = ApiUtils::boolField(obj, "can_reconstruct", info.availableShards >= info.neededShards);
    return info;
}

////////////////////////////////////////////
// ReportedFileStatus methods
////////////////////////////////////////////

ReportedFileStatus::ReportedFileStatus()
    : onlineShards(0),
      neededShards(0),
      canSurviveMore(),
      reconstructable(false)
{
}

ReportedFileStatus ReportedFileStatus::fromJson(const json::value &obj)
{
    if (!obj.is_object())
        throw std::runtime_error("file status response is not an object");

    ReportedFileStatus reported;
    reported.onlineShards = static_cast<uint32_t>(ApiUtils::intField(obj, "online_shards", 0));
    reported.neededShards = static_cast<uint32_t>(ApiUtils::intField(obj, "needed_shards", 0));
    reported.reconstructable = ApiUtils::boolField(obj, "reconstructable", false);
    reported.health = ApiUtils::stringField(obj, "health", "");

    int64_t canSurviveMore = ApiUtils::intField(obj, "can_survive_more", -1);
    if (canSurviveMore >= 0)
        reported.canSurviveMore = static_cast<uint32_t>(canSurviveMore);

    return reported;
}

////////////////////////////////////////////
// HealthEvaluator
////////////////////////////////////////////

namespace HealthEvaluator
{
    namespace
    {
        /**
         * Classifies health per scheme. Every scheme shares the same rule
         * today: all shards online is Healthy, a reachable quorum is 
         * Degraded, anything less is Critical.
         */
        struct ClassifyVisitor
        {
            uint32_t onlineShards;
            uint32_t totalShards;
            bool reconstructable;

            FileHealth quorumRule() const
            {
                if (!reconstructable)
                    return FileHealth::Critical;
                return onlineShards == totalShards ? FileHealth::Healthy : FileHealth::Degraded;
            }

            FileHealth operator()(const Replication &) const { return quorumRule(); }
            FileHealth operator()(const ReedSolomon &) const { return quorumRule(); }
            FileHealth operator()(const XorParity &) const { return quorumRule(); }
        };
    }

    FileHealthStatus evaluate(const FileRecord &file, const NodeRegistrySnapshot &nodes)
    {
        FileHealthStatus status;
        status.totalShards = static_cast<uint32_t>(file.shards.size());

        for (const auto &shard : file.shards)
        {
            bool online = nodes.isOnline(shard.nodeId);
            status.shardStatus.push_back({shard.index, shard.nodeId, online, shard.sizeBytes});

            if (online)
                status.onlineShards++;
            else
                status.missingShardIndices.push_back(shard.index);
        }

        if (file.shards.empty())
        {
            status.issue = "no shards recorded";
            return status;
        }

        if (!file.scheme)
        {
            status.issue = file.schemeIssue.empty() ? "no encoding scheme" : file.schemeIssue;
            return status;
        }

        // shards the scheme declares but the catalog never recorded count as missing
        uint32_t declared = Schemes::declaredShards(*file.scheme);
        if (declared > status.totalShards)
        {
            std::set<uint32_t> recorded;
            for (const auto &shard : file.shards)
                recorded.insert(shard.index);

            size_t absent = declared - recorded.size();
            for (uint32_t index = 0; absent > 0; index++)
            {
                if (recorded.find(index) == recorded.end())
                {
                    status.missingShardIndices.push_back(index);
                    absent--;
                }
            }
            std::sort(status.missingShardIndices.begin(), status.missingShardIndices.end());

            status.issue = std::to_string(status.totalShards) + " of " + std::to_string(declared) + " declared shards recorded";
            status.totalShards = declared;
        }

        status.neededShards = Schemes::neededShards(*file.scheme);
        status.reconstructable = status.onlineShards >= status.neededShards;
        status.canSurviveMore = status.reconstructable ? status.onlineShards - status.neededShards : 0;

        ClassifyVisitor classify{status.onlineShards, status.totalShards, status.reconstructable};
        status.health = std::visit(classify, *file.scheme);

        return status;
    }

    ReconstructionInfo reconstructionInfo(const FileRecord &file, const NodeRegistrySnapshot &nodes)
    {
        FileHealthStatus status = evaluate(file, nodes);

        ReconstructionInfo info;
        info.fileId = file.id;
        info.filename = file.filename;
        info.totalShards = status.totalShards;
        info.availableShards = status.onlineShards;
        info.neededShards = status.neededShards;
        info.missingShardIndices = status.missingShardIndices;
        info.canReconstruct = status.reconstructable;
        info.originalSizeBytes = file.originalSizeBytes;
        return info;
    }

    ConsistencyReport compare(
        const std::string &fileId,
        const FileHealthStatus &local,
        const ReportedFileStatus &reported
    )
    {
        ConsistencyReport report;
        report.fileId = fileId;

        auto check = [&report](const std::string &field, uint32_t localValue, uint32_t reportedValue)
        {
            if (localValue != reportedValue)
            {
                report.mismatches.push_back(field + ": local " + std::to_string(localValue) 
                    + ", service " + std::to_string(reportedValue));
            }
        };

        check("online_shards", local.onlineShards, reported.onlineShards);
        check("needed_shards", local.neededShards, reported.neededShards);
        check("reconstructable", local.reconstructable, reported.reconstructable);
        if (reported.canSurviveMore)
            check("can_survive_more", local.canSurviveMore, *reported.canSurviveMore);

        return report;
    }
}

////////////////////////////////////////////
// HealthEvaluator tests
////////////////////////////////////////////
namespace HealthEvaluatorTests
{
    void testReedSolomonLadder()
    {
        FileRecord file = Fixtures::makeSpreadFile("rs", ReedSolomon{4, 2});

        FileHealthStatus all = HealthEvaluator::evaluate(file, Fixtures::makeNodes(6));
        ASSERT_THAT(all.onlineShards == 6);
        ASSERT_THAT(all.neededShards == 4);
        ASSERT_THAT(all.health == FileHealth::Healthy);
        ASSERT_THAT(all.canSurviveMore == 2);
        ASSERT_THAT(all.reconstructable);

        FileHealthStatus four = HealthEvaluator::evaluate(file, Fixtures::makeNodes(6, {"node-5", "node-6"}));
        ASSERT_THAT(four.onlineShards == 4);
        ASSERT_THAT(four.health == FileHealth::Degraded);
        ASSERT_THAT(four.reconstructable);
        ASSERT_THAT(four.canSurviveMore == 0);
        ASSERT_THAT(four.missingShardIndices == std::vector<uint32_t>({4, 5}));

        FileHealthStatus three = HealthEvaluator::evaluate(file, Fixtures::makeNodes(6, {"node-1", "node-5", "node-6"}));
        ASSERT_THAT(three.onlineShards == 3);
        ASSERT_THAT(three.health == FileHealth::Critical);
        ASSERT_THAT(!three.reconstructable);
        ASSERT_THAT(three.canSurviveMore == 0);
    }

    void testReplicationSingleCopy()
    {
        FileRecord file = Fixtures::makeSpreadFile("rep", Replication{3});

        FileHealthStatus one = HealthEvaluator::evaluate(file, Fixtures::makeNodes(3, {"node-1", "node-2"}));
        ASSERT_THAT(one.onlineShards == 1);
        ASSERT_THAT(one.neededShards == 1);
        ASSERT_THAT(one.reconstructable);
        ASSERT_THAT(one.health == FileHealth::Degraded);
        ASSERT_THAT(one.canSurviveMore == 0);

        FileHealthStatus none = HealthEvaluator::evaluate(file, Fixtures::makeNodes(3, {"node-1", "node-2", "node-3"}));
        ASSERT_THAT(none.onlineShards == 0);
        ASSERT_THAT(!none.reconstructable);
        ASSERT_THAT(none.health == FileHealth::Critical);

        FileHealthStatus all = HealthEvaluator::evaluate(file, Fixtures::makeNodes(3));
        ASSERT_THAT(all.health == FileHealth::Healthy);
        ASSERT_THAT(all.canSurviveMore == 2);
    }

    void testXorParity()
    {
        FileRecord file = Fixtures::makeSpreadFile("xor", XorParity{2, 1});

        ASSERT_THAT(HealthEvaluator::evaluate(file, Fixtures::makeNodes(3)).health == FileHealth::Healthy);

        FileHealthStatus lostParity = HealthEvaluator::evaluate(file, Fixtures::makeNodes(3, {"node-3"}));
        ASSERT_THAT(lostParity.health == FileHealth::Degraded);
        ASSERT_THAT(lostParity.neededShards == 2);

        FileHealthStatus lostTwo = HealthEvaluator::evaluate(file, Fixtures::makeNodes(3, {"node-1", "node-3"}));
        ASSERT_THAT(lostTwo.health == FileHealth::Critical);
    }

    void testShortRecord()
    {
        // RS(4, 2) with only shards 0, 1, 2 and 4 recorded
        FileRecord file = Fixtures::makeFile("short", ReedSolomon{4, 2}, {"node-1", "node-2", "node-3", "node-4"});
        file.shards[3].index = 4;

        FileHealthStatus allOnline = HealthEvaluator::evaluate(file, Fixtures::makeNodes(4));
        ASSERT_THAT(allOnline.totalShards == 6);
        ASSERT_THAT(allOnline.onlineShards == 4);
        ASSERT_THAT(allOnline.reconstructable);
        ASSERT_THAT(allOnline.health == FileHealth::Degraded);
        ASSERT_THAT(allOnline.canSurviveMore == 0);
        ASSERT_THAT(allOnline.missingShardIndices == std::vector<uint32_t>({3, 5}));
        ASSERT_THAT(allOnline.issue == "4 of 6 declared shards recorded");

        FileHealthStatus oneDown = HealthEvaluator::evaluate(file, Fixtures::makeNodes(4, {"node-1"}));
        ASSERT_THAT(oneDown.health == FileHealth::Critical);
        ASSERT_THAT(oneDown.missingShardIndices == std::vector<uint32_t>({0, 3, 5}));

        ReconstructionInfo info = HealthEvaluator::reconstructionInfo(file, Fixtures::makeNodes(4, {"node-1"}));
        ASSERT_THAT(info.totalShards == 6);
        ASSERT_THAT(info.shortfall() == 1);
    }

    void testUnknownNodesCountAsOffline()
    {
        // shards on node-7 and node-8, which the snapshot doesn't contain
        FileRecord file = Fixtures::makeFile("ghost", ReedSolomon{2, 2}, {"node-1", "node-2", "node-7", "node-8"});

        FileHealthStatus status = HealthEvaluator::evaluate(file, Fixtures::makeNodes(5));
        ASSERT_THAT(status.onlineShards == 2);
        ASSERT_THAT(status.health == FileHealth::Degraded);
        ASSERT_THAT(status.missingShardIndices == std::vector<uint32_t>({2, 3}));

        FileHealthStatus empty = HealthEvaluator::evaluate(file, NodeRegistrySnapshot());
        ASSERT_THAT(empty.onlineShards == 0);
        ASSERT_THAT(empty.health == FileHealth::Critical);
    }

    void testUnknownHealth()
    {
        // no shards recorded
        FileRecord noShards = Fixtures::makeFile("empty", ReedSolomon{3, 2}, {});
        FileHealthStatus a = HealthEvaluator::evaluate(noShards, Fixtures::makeNodes(5));
        ASSERT_THAT(a.health == FileHealth::Unknown);
        ASSERT_THAT(!a.reconstructable);
        ASSERT_THAT(a.issue == "no shards recorded");

        // scheme config missing: no k is guessed
        FileRecord noScheme = Fixtures::makeSpreadFile("noscheme", ReedSolomon{3, 2});
        noScheme.scheme.reset();
        noScheme.schemeIssue = "reed-solomon config has no k";

        FileHealthStatus b = HealthEvaluator::evaluate(noScheme, Fixtures::makeNodes(5));
        ASSERT_THAT(b.health == FileHealth::Unknown);
        ASSERT_THAT(b.onlineShards == 5);
        ASSERT_THAT(b.neededShards == 0);
        ASSERT_THAT(!b.reconstructable);
        ASSERT_THAT(b.canSurviveMore == 0);
        ASSERT_THAT(b.issue == "reed-solomon config has no k");
    }

    void testDeterministic()
    {
        FileRecord file = Fixtures::makeSpreadFile("det", ReedSolomon{3, 2});
        NodeRegistrySnapshot nodes = Fixtures::makeNodes(5, {"node-2"});

        FileHealthStatus first = HealthEvaluator::evaluate(file, nodes);
        for (int i = 0; i < 10; i++)
            ASSERT_THAT(HealthEvaluator::evaluate(file, nodes) == first);

        NodeRegistrySnapshot changed = Fixtures::makeNodes(5, {"node-2", "node-3"});
        ASSERT_THAT(HealthEvaluator::evaluate(file, changed) != first);
    }

    void testReconstructionInfo()
    {
        FileRecord file = Fixtures::makeSpreadFile("info", ReedSolomon{3, 2});

        ReconstructionInfo blocked = HealthEvaluator::reconstructionInfo(file, Fixtures::makeNodes(5, {"node-1", "node-2", "node-3"}));
        ASSERT_THAT(blocked.totalShards == 5);
        ASSERT_THAT(blocked.availableShards == 2);
        ASSERT_THAT(blocked.neededShards == 3);
        ASSERT_THAT(!blocked.canReconstruct);
        ASSERT_THAT(blocked.shortfall() == 1);
        ASSERT_THAT(blocked.missingShardIndices == std::vector<uint32_t>({0, 1, 2}));

        json::value response = json::value::parse(
            "{\"file_id\": \"info\", \"filename\": \"info.bin\", \"total_shards\": 5, \"available_shards\": 4,"
            " \"missing_shards\": [1], \"needed_shards\": 3, \"can_reconstruct\": true, \"original_size\": 300}");
        ReconstructionInfo parsed = ReconstructionInfo::fromJson(response);
        ASSERT_THAT(parsed.canReconstruct);
        ASSERT_THAT(parsed.shortfall() == 0);
        ASSERT_THAT(parsed.missingShardIndices == std::vector<uint32_t>({1}));
        ASSERT_THAT(parsed.originalSizeBytes == 300);
    }

    void testCompare()
    {
        FileRecord file = Fixtures::makeSpreadFile("cmp", ReedSolomon{3, 2});
        FileHealthStatus local = HealthEvaluator::evaluate(file, Fixtures::makeNodes(5, {"node-4"}));

        ReportedFileStatus agreeing = ReportedFileStatus::fromJson(json::value::parse(
            "{\"online_shards\": 4, \"needed_shards\": 3, \"reconstructable\": true, \"health\": \"healthy\"}"));
        ASSERT_THAT(!agreeing.canSurviveMore.has_value());
        ASSERT_THAT(HealthEvaluator::compare("cmp", local, agreeing).consistent());

        ReportedFileStatus disagreeing = ReportedFileStatus::fromJson(json::value::parse(
            "{\"online_shards\": 5, \"needed_shards\": 3, \"can_survive_more\": 2,"
            " \"reconstructable\": true, \"health\": \"healthy\"}"));
        ConsistencyReport report = HealthEvaluator::compare("cmp", local, disagreeing);
        ASSERT_THAT(!report.consistent());
        ASSERT_THAT(report.mismatches.size() == 2);
        ASSERT_THAT(report.mismatches[0] == "online_shards: local 4, service 5");
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "HealthEvaluator Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testReedSolomonLadder),
            TEST(testReplicationSingleCopy),
            TEST(testXorParity),
            TEST(testShortRecord),
            TEST(testUnknownNodesCountAsOffline),
            TEST(testUnknownHealth),
            TEST(testDeterministic),
            TEST(testReconstructionInfo),
            TEST(testCompare)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
