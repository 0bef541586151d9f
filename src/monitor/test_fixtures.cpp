#include "test_fixtures.hpp"
#include "encoding_scheme.hpp"

namespace Fixtures
{
    NodeRegistrySnapshot makeNodes(uint32_t count, const std::set<std::string> &offline)
    {
        NodeRegistrySnapshot snapshot;
        for (uint32_t i = 1; i <= count; i++)
        {
            std::string nodeId = "node-" + std::to_string(i);
            bool isOffline = offline.find(nodeId) != offline.end();

            StorageNode node(nodeId, isOffline ? NodeState::SimulatedFailure : NodeState::Online);
            node.stats.capacityBytes = 1000;
            snapshot.add(node);
        }

        snapshot.reportedTotalNodes = count;
        snapshot.reportedOnlineNodes = count - static_cast<uint32_t>(offline.size());
        return snapshot;
    }

    FileRecord makeFile(const std::string &fileId, EncodingScheme scheme, const std::vector<std::string> &nodeIds)
    {
        std::vector<ShardRef> shards;
        for (uint32_t i = 0; i < nodeIds.size(); i++)
            shards.emplace_back(i, nodeIds[i], 100);

        FileRecord file(fileId, fileId + ".bin", scheme, shards);
        file.originalSizeBytes = 100 * Schemes::neededShards(scheme);
        return file;
    }

    FileRecord makeSpreadFile(const std::string &fileId, EncodingScheme scheme)
    {
        std::vector<std::string> nodeIds;
        for (uint32_t i = 0; i < Schemes::declaredShards(scheme); i++)
            nodeIds.push_back("node-" + std::to_string(i + 1));
        return makeFile(fileId, scheme, nodeIds);
    }

    json::value nodesJson(const NodeRegistrySnapshot &snapshot)
    {
        json::value response;
        std::vector<json::value> nodes;
        uint32_t online = 0;

        for (const auto &[nodeId, node] : snapshot.nodes)
        {
            json::value entry;
            entry[U("node_id")] = json::value::string(nodeId);
            entry[U("status")] = json::value::string(toString(node.state));
            entry[U("capacity_bytes")] = json::value::number(static_cast<int64_t>(node.stats.capacityBytes));
            entry[U("used_bytes")] = json::value::number(static_cast<int64_t>(node.stats.usedBytes));
            entry[U("files_count")] = json::value::number(node.stats.fileCount);
            entry[U("simulated_failure")] = json::value::boolean(node.simulatedFailure);
            nodes.push_back(entry);

            if (node.isOnline())
                online++;
        }

        response[U("total_nodes")] = json::value::number(static_cast<uint32_t>(nodes.size()));
        response[U("online_nodes")] = json::value::number(online);
        response[U("nodes")] = json::value::array(nodes);
        return response;
    }

    json::value fileJson(const FileRecord &file)
    {
        json::value record;
        record[U("id")] = json::value::string(file.id);
        record[U("filename")] = json::value::string(file.filename);
        record[U("original_size")] = json::value::number(static_cast<int64_t>(file.originalSizeBytes));
        record[U("algorithm")] = json::value::string(file.algorithm);
        record[U("cost_estimate")] = json::value::number(file.costEstimate);

        json::value config = json::value::object();
        if (file.scheme)
        {
            if (auto rep = std::get_if<Replication>(&*file.scheme))
                config[U("replication_factor")] = json::value::number(rep->factor);
            else if (auto rs = std::get_if<ReedSolomon>(&*file.scheme))
            {
                config[U("k")] = json::value::number(rs->k);
                config[U("m")] = json::value::number(rs->m);
            }
            else if (auto xp = std::get_if<XorParity>(&*file.scheme))
            {
                config[U("data")] = json::value::number(xp->data);
                config[U("parity")] = json::value::number(xp->parity);
            }
        }
        config[U("compress")] = json::value::boolean(file.compressed);
        record[U("config")] = config;

        std::vector<json::value> shards;
        for (const auto &shard : file.shards)
        {
            json::value entry;
            entry[U("bucket")] = json::value::string(shard.nodeId);
            entry[U("shard_index")] = json::value::number(shard.index);
            entry[U("size")] = json::value::number(static_cast<int64_t>(shard.sizeBytes));
            shards.push_back(entry);
        }
        record[U("shards")] = json::value::array(shards);
        return record;
    }
}
