#pragma once

#include <cpprest/json.h>
#include <cpprest/asyncrt_utils.h>

#include <string>
#include <map>
#include <vector>

#include "ingest_defaults.hpp"

using namespace web;

/**
 * Live/offline state of a storage node.
 */
enum class NodeState
{
    Online,
    SimulatedFailure
};

std::string toString(NodeState state);

/**
 * Represents usage statistics of a single storage node.
 */
struct StorageNodeStats
{
    uint64_t capacityBytes;
    uint64_t usedBytes;
    uint32_t fileCount;

    /* Default constructor */
    StorageNodeStats()
        : capacityBytes(IngestDefaults::NODE_CAPACITY_BYTES),
          usedBytes(IngestDefaults::NODE_USED_BYTES),
          fileCount(IngestDefaults::NODE_FILE_COUNT)
    {
    }
};

/**
 * Represents a storage node, as reported by the node registry.
 */
class StorageNode {
public:
    /**
     * Unique id of the node (the registry's bucket name, e.g. "node-1")
     */
    std::string id;

    /**
     * Denotes whether the node is reachable, as per the registry's last 
     * health check or a simulated failure.
     */
    NodeState state;

    /**
     * True if the registry reports the node's outage as simulated 
     * (see FailureSimulator), rather than a real one.
     */
    bool simulatedFailure;

    /* Node statistics */
    StorageNodeStats stats;

    /* Time of the registry's last check of this node */
    utility::datetime lastChecked;

    /* Default constructor */
    StorageNode();

    /* Param constructor */
    StorageNode(std::string id, NodeState state);

    bool isOnline() const { return state == NodeState::Online; }

    /* Capacity left on the node (all of it, while the node is offline) */
    uint64_t availableBytes() const;

    /* Used bytes as a percentage of capacity */
    double utilizationPercent() const;

    /* Returns human-readable representation of the storage node */
    std::string toString() const;

    /**
     * Decodes one entry of the registry's `nodes` array.
     * 
     * Throws std::runtime_error if the entry has no `node_id`.
     */
    static StorageNode fromJson(const json::value &obj, uint64_t defaultCapacityBytes);
};

/**
 * Point-in-time copy of the node registry.
 */
class NodeRegistrySnapshot
{
public:
    /**
     * Mapping is of the form: { node id -> StorageNode object }.
     */
    std::map<std::string, StorageNode> nodes;

    /* Totals as reported by the registry itself */
    uint32_t reportedTotalNodes;
    uint32_t reportedOnlineNodes;

    NodeRegistrySnapshot();

    /**
     * Returns the node with the given id, or nullptr if the snapshot 
     * doesn't contain it.
     */
    const StorageNode *find(const std::string &nodeId) const;

    /**
     * True iff the node exists and is online. Unknown ids are offline.
     */
    bool isOnline(const std::string &nodeId) const;

    /* Adds (or replaces) a node */
    void add(StorageNode node);

    /**
     * Decodes a `GET /nodes/status` response.
     * 
     * Malformed node entries are skipped (and logged).
     */
    static NodeRegistrySnapshot fromJson(
        const json::value &response, 
        uint64_t defaultCapacityBytes = IngestDefaults::NODE_CAPACITY_BYTES
    );
};

namespace StorageNodeTests
{
    void testNodeFromJson();
    void testNodeDefaults();
    void testSnapshotFromJson();
    void runAll();
}
