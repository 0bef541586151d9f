#pragma once

#include <cpprest/json.h>

#include <string>
#include <vector>
#include <optional>

#include "file_record.hpp"
#include "storage_node.hpp"

using namespace web;

/**
 * Qualitative redundancy health of a file.
 */
enum class FileHealth
{
    Healthy,
    Degraded,
    Critical,
    Unknown
};

std::string toString(FileHealth health);

/**
 * Derived online/offline status of a single shard.
 */
struct ShardStatus
{
    uint32_t index;
    std::string nodeId;
    bool online;
    uint64_t sizeBytes;
};

/**
 * Redundancy status of a file, derived from its record and a node snapshot.
 * 
 * NOTE:
 * 
 * Never persisted or cached - recomputed on every read 
 * (see MonitorSession::fileStatus()).
 */
struct FileHealthStatus
{
    uint32_t onlineShards;
    uint32_t neededShards;
    uint32_t totalShards;

    /* additional node losses the file tolerates while staying reconstructable */
    uint32_t canSurviveMore;

    bool reconstructable;
    FileHealth health;

    std::vector<ShardStatus> shardStatus;
    std::vector<uint32_t> missingShardIndices;

    /* why health is Unknown, or why the record is short of its declared shards */
    std::string issue;

    FileHealthStatus();

    bool operator==(const FileHealthStatus &other) const;
    bool operator!=(const FileHealthStatus &other) const { return !(*this == other); }
};

/**
 * Reconstruction feasibility of a file, as returned by 
 * `GET /file/{id}/reconstruct-info` or derived locally.
 */
struct ReconstructionInfo
{
    std::string fileId;
    std::string filename;
    uint32_t totalShards;
    uint32_t availableShards;
    uint32_t neededShards;
    std::vector<uint32_t> missingShardIndices;
    bool canReconstruct;
    uint64_t originalSizeBytes;

    ReconstructionInfo();

    /* number of shards missing from the quorum, 0 if reconstructable */
    uint32_t shortfall() const;

    static ReconstructionInfo fromJson(const json::value &obj);
};

/**
 * A file status as reported by `GET /file/{id}/status`.
 */
struct ReportedFileStatus
{
    uint32_t onlineShards;
    uint32_t neededShards;
    std::optional<uint32_t> canSurviveMore;
    bool reconstructable;
    std::string health;

    ReportedFileStatus();

    static ReportedFileStatus fromJson(const json::value &obj);
};

/**
 * Result of comparing a locally derived status with the service's.
 */
struct ConsistencyReport
{
    std::string fileId;
    std::vector<std::string> mismatches;

    bool consistent() const { return mismatches.empty(); }
};

/**
 * Pure functions that turn (file record, node snapshot) into a file's 
 * redundancy status.
 * 
 * None of them throw: unknown or missing node references count as offline, 
 * and a file with no usable scheme is reported as Unknown.
 */
namespace HealthEvaluator
{
    /**
     * Derives the redundancy status of `file` given the node states in `nodes`.
     */
    FileHealthStatus evaluate(const FileRecord &file, const NodeRegistrySnapshot &nodes);

    /**
     * Derives the reconstruction feasibility of `file` given `nodes`.
     */
    ReconstructionInfo reconstructionInfo(const FileRecord &file, const NodeRegistrySnapshot &nodes);

    /**
     * Compares a locally derived status against the service's report of 
     * the same file.
     * 
     * NOTE:
     * 
     * Health labels aren't compared - the service classifies with a 
     * coarser rule than ours.
     */
    ConsistencyReport compare(
        const std::string &fileId,
        const FileHealthStatus &local,
        const ReportedFileStatus &reported
    );
}

namespace HealthEvaluatorTests
{
    void testReedSolomonLadder();
    void testReplicationSingleCopy();
    void testXorParity();
    void testShortRecord();
    void testUnknownNodesCountAsOffline();
    void testUnknownHealth();
    void testDeterministic();
    void testReconstructionInfo();
    void testCompare();
    void runAll();
}
