#pragma once

#include <string>
#include <vector>

#include "storage_node.hpp"
#include "file_record.hpp"

/**
 * Fleet-wide node health signal.
 * 
 * NOTE:
 * 
 * This is a coarse step function over the number of offline nodes, and is
 * independent of (and not to be confused with) per-file health.
 */
struct ClusterHealthSummary
{
    uint32_t totalNodes;
    uint32_t onlineNodes;
    uint32_t offlineNodes;

    /* 0 - 100 */
    uint32_t healthScore;
    std::string healthLabel;
};

/**
 * Storage usage rolled up over all nodes and files.
 */
struct ClusterUsage
{
    uint64_t capacityBytes;
    uint64_t usedBytes;
    double utilizationPercent;
    uint32_t totalFiles;

    /* mean storage-overhead multiplier over all files */
    double averageOverhead;
};

namespace ClusterHealth
{
    /**
     * Summarises the given node states into a health score and label.
     */
    ClusterHealthSummary summarize(const NodeRegistrySnapshot &nodes);

    /**
     * Rolls up capacity and usage of `nodes` and the overhead of `files`.
     */
    ClusterUsage usage(const NodeRegistrySnapshot &nodes, const std::vector<FileRecord> &files);
}

namespace ClusterHealthTests
{
    void testStepFunction();
    void testEmptyCluster();
    void testUsage();
    void runAll();
}
