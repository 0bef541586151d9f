#pragma once

#include <string>
#include <vector>
#include <set>

#include "storage_node.hpp"
#include "file_record.hpp"

/**
 * Builders for nodes and files used by the test suites.
 */
namespace Fixtures
{
    /**
     * Snapshot of nodes "node-1" ... "node-`count`", all online except 
     * those named in `offline`.
     */
    NodeRegistrySnapshot makeNodes(uint32_t count, const std::set<std::string> &offline = {});

    /**
     * File `fileId` with one shard per entry of `nodeIds`, shard i
     * stored on nodeIds[i].
     */
    FileRecord makeFile(const std::string &fileId, EncodingScheme scheme, const std::vector<std::string> &nodeIds);

    /**
     * File `fileId` with shard i on "node-(i+1)" for each of the scheme's 
     * declared shards.
     */
    FileRecord makeSpreadFile(const std::string &fileId, EncodingScheme scheme);

    /**
     * `GET /nodes/status` response body for the given snapshot.
     */
    json::value nodesJson(const NodeRegistrySnapshot &snapshot);

    /**
     * One `GET /files` record for the given file.
     */
    json::value fileJson(const FileRecord &file);
}
