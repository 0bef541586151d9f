#include <iostream>
#include <functional>

#include "cluster_health.hpp"
#include "test_utils.hpp"
#include "test_fixtures.hpp"

namespace ClusterHealth
{
    ClusterHealthSummary summarize(const NodeRegistrySnapshot &nodes)
    {
        ClusterHealthSummary summary;
        summary.totalNodes = static_cast<uint32_t>(nodes.nodes.size());
        summary.onlineNodes = 0;

        for (const auto &[nodeId, node] : nodes.nodes)
        {
            if (node.isOnline())
                summary.onlineNodes++;
        }
        summary.offlineNodes = summary.totalNodes - summary.onlineNodes;

        if (summary.offlineNodes == 0)
        {
            summary.healthScore = 100;
            summary.healthLabel = "Excellent";
        }
        else if (summary.offlineNodes == 1)
        {
            summary.healthScore = 75;
            summary.healthLabel = "Warning";
        }
        else
        {
            summary.healthScore = 35;
            summary.healthLabel = "Critical";
        }

        return summary;
    }

    ClusterUsage usage(const NodeRegistrySnapshot &nodes, const std::vector<FileRecord> &files)
    {
        ClusterUsage usage{0, 0, 0.0, 0, 0.0};

        for (const auto &[nodeId, node] : nodes.nodes)
        {
            usage.capacityBytes += node.stats.capacityBytes;
            usage.usedBytes += node.stats.usedBytes;
        }

        if (usage.capacityBytes > 0)
            usage.utilizationPercent = static_cast<double>(usage.usedBytes) / usage.capacityBytes * 100.0;

        usage.totalFiles = static_cast<uint32_t>(files.size());

        double overheadSum = 0.0;
        for (const auto &file : files)
            overheadSum += file.costEstimate;

        if (!files.empty())
            usage.averageOverhead = overheadSum / files.size();

        return usage;
    }
}

////////////////////////////////////////////
// ClusterHealth tests
////////////////////////////////////////////
namespace ClusterHealthTests
{
    void testStepFunction()
    {
        ClusterHealthSummary excellent = ClusterHealth::summarize(Fixtures::makeNodes(5));
        ASSERT_THAT(excellent.totalNodes == 5);
        ASSERT_THAT(excellent.offlineNodes == 0);
        ASSERT_THAT(excellent.healthLabel == "Excellent" && excellent.healthScore == 100);

        ClusterHealthSummary warning = ClusterHealth::summarize(Fixtures::makeNodes(5, {"node-3"}));
        ASSERT_THAT(warning.onlineNodes == 4);
        ASSERT_THAT(warning.offlineNodes == 1);
        ASSERT_THAT(warning.healthLabel == "Warning" && warning.healthScore == 75);

        ClusterHealthSummary critical = ClusterHealth::summarize(Fixtures::makeNodes(5, {"node-1", "node-3"}));
        ASSERT_THAT(critical.offlineNodes == 2);
        ASSERT_THAT(critical.healthLabel == "Critical" && critical.healthScore == 35);

        ClusterHealthSummary allDown = ClusterHealth::summarize(
            Fixtures::makeNodes(5, {"node-1", "node-2", "node-3", "node-4", "node-5"}));
        ASSERT_THAT(allDown.offlineNodes == 5);
        ASSERT_THAT(allDown.healthScore == 35);
    }

    void testEmptyCluster()
    {
        // a failed node poll degrades to zero nodes, which has nothing offline
        ClusterHealthSummary summary = ClusterHealth::summarize(NodeRegistrySnapshot());
        ASSERT_THAT(summary.totalNodes == 0);
        ASSERT_THAT(summary.offlineNodes == 0);
        ASSERT_THAT(summary.healthScore == 100);
    }

    void testUsage()
    {
        NodeRegistrySnapshot nodes = Fixtures::makeNodes(2);
        nodes.nodes["node-1"].stats.usedBytes = 250;
        nodes.nodes["node-2"].stats.usedBytes = 250;

        FileRecord a = Fixtures::makeSpreadFile("a", Replication{2});
        a.costEstimate = 2.0;
        FileRecord b = Fixtures::makeSpreadFile("b", ReedSolomon{1, 1});
        b.costEstimate = 1.0;

        ClusterUsage usage = ClusterHealth::usage(nodes, {a, b});
        ASSERT_THAT(usage.capacityBytes == 2000);
        ASSERT_THAT(usage.usedBytes == 500);
        ASSERT_THAT(usage.utilizationPercent == 25.0);
        ASSERT_THAT(usage.totalFiles == 2);
        ASSERT_THAT(usage.averageOverhead == 1.5);

        ClusterUsage empty = ClusterHealth::usage(NodeRegistrySnapshot(), {});
        ASSERT_THAT(empty.utilizationPercent == 0.0);
        ASSERT_THAT(empty.averageOverhead == 0.0);
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "ClusterHealth Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testStepFunction),
            TEST(testEmptyCluster),
            TEST(testUsage)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
