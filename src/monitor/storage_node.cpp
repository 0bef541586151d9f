#include <cpprest/json.h>
#include <cpprest/asyncrt_utils.h>

#include <iostream>
#include <functional>

#include "storage_node.hpp"
#include "utils.hpp"
#include "test_utils.hpp"

using namespace web;

std::string toString(NodeState state)
{
    return state == NodeState::Online ? "online" : "offline";
}

////////////////////////////////////////////
// StorageNode methods
////////////////////////////////////////////

/* Default constructor */
StorageNode::StorageNode()
    : id(),
      state(NodeState::SimulatedFailure),
      simulatedFailure(false),
      stats(),
      lastChecked()
{
}

/* Param constructor */
StorageNode::StorageNode(std::string id, NodeState state)
    : id(id),
      state(state),
      simulatedFailure(state == NodeState::SimulatedFailure),
      stats(),
      lastChecked()
{
}

uint64_t StorageNode::availableBytes() const
{
    if (!isOnline())
        return stats.capacityBytes;
    if (stats.usedBytes >= stats.capacityBytes)
        return 0;
    return stats.capacityBytes - stats.usedBytes;
}

double StorageNode::utilizationPercent() const
{
    if (stats.capacityBytes == 0)
        return 0.0;
    return static_cast<double>(stats.usedBytes) / stats.capacityBytes * 100.0;
}

std::string StorageNode::toString() const
{
    return "storage node: " + id + " (" + ::toString(state) + ")";
}

StorageNode StorageNode::fromJson(const json::value &obj, uint64_t defaultCapacityBytes)
{
    std::string nodeId = ApiUtils::stringField(obj, "node_id", "");
    if (nodeId.empty())
        throw std::runtime_error("node entry without node_id: " + obj.serialize());

    std::string status = StringUtils::toLower(ApiUtils::stringField(obj, "status", "offline"));
    bool simulated = ApiUtils::boolField(obj, "simulated_failure", false);

    StorageNode node(nodeId, (status == "online" && !simulated) ? NodeState::Online : NodeState::SimulatedFailure);
    node.simulatedFailure = simulated;

    /**
     * Capacity: capacity_bytes, else capacity_gb, else the configured default.
     */
    int64_t capacityBytes = ApiUtils::intField(obj, "capacity_bytes", 0);
    int64_t capacityGb = ApiUtils::intField(obj, "capacity_gb", 0);
    if (capacityBytes > 0)
        node.stats.capacityBytes = static_cast<uint64_t>(capacityBytes);
    else if (capacityGb > 0)
        node.stats.capacityBytes = static_cast<uint64_t>(capacityGb) * IngestDefaults::BYTES_PER_GB;
    else
        node.stats.capacityBytes = defaultCapacityBytes;

    int64_t usedBytes = ApiUtils::intField(obj, "used_bytes", IngestDefaults::NODE_USED_BYTES);
    node.stats.usedBytes = usedBytes > 0 ? static_cast<uint64_t>(usedBytes) : 0;

    int64_t fileCount = ApiUtils::intField(obj, "files_count", IngestDefaults::NODE_FILE_COUNT);
    node.stats.fileCount = fileCount > 0 ? static_cast<uint32_t>(fileCount) : 0;

    std::string lastChecked = ApiUtils::stringField(obj, "last_checked", "");
    if (!lastChecked.empty())
        node.lastChecked = utility::datetime::from_string(lastChecked, utility::datetime::ISO_8601);

    return node;
}

////////////////////////////////////////////
// NodeRegistrySnapshot methods
////////////////////////////////////////////

NodeRegistrySnapshot::NodeRegistrySnapshot()
    : nodes(),
      reportedTotalNodes(0),
      reportedOnlineNodes(0)
{
}

const StorageNode *NodeRegistrySnapshot::find(const std::string &nodeId) const
{
    auto it = nodes.find(nodeId);
    return it == nodes.end() ? nullptr : &it->second;
}

bool NodeRegistrySnapshot::isOnline(const std::string &nodeId) const
{
    const StorageNode *node = find(nodeId);
    return node != nullptr && node->isOnline();
}

void NodeRegistrySnapshot::add(StorageNode node)
{
    std::string nodeId = node.id;
    nodes[nodeId] = std::move(node);
}

NodeRegistrySnapshot NodeRegistrySnapshot::fromJson(const json::value &response, uint64_t defaultCapacityBytes)
{
    NodeRegistrySnapshot snapshot;

    if (!response.is_object() || !response.has_array_field(U("nodes")))
        throw std::runtime_error("node status response has no `nodes` array");

    for (const auto &entry : response.at(U("nodes")).as_array())
    {
        try
        {
            StorageNode node = StorageNode::fromJson(entry, defaultCapacityBytes);
            if (snapshot.find(node.id) != nullptr)
                std::cout << "[ingest] duplicate node id " << node.id << ", keeping the last entry" << std::endl;
            snapshot.add(std::move(node));
        }
        catch (const std::exception &e)
        {
            std::cout << "[ingest] skipping node entry: " << e.what() << std::endl;
        }
    }

    snapshot.reportedTotalNodes = static_cast<uint32_t>(
        ApiUtils::intField(response, "total_nodes", static_cast<int64_t>(snapshot.nodes.size())));

    uint32_t onlineCount = 0;
    for (const auto &[nodeId, node] : snapshot.nodes)
    {
        if (node.isOnline())
            onlineCount++;
    }
    snapshot.reportedOnlineNodes = static_cast<uint32_t>(
        ApiUtils::intField(response, "online_nodes", onlineCount));

    return snapshot;
}

////////////////////////////////////////////
// StorageNode tests
////////////////////////////////////////////
namespace StorageNodeTests
{
    void testNodeFromJson()
    {
        json::value obj = json::value::parse(
            "{\"node_id\": \"node-2\", \"status\": \"online\", \"files_count\": 3,"
            " \"capacity_gb\": 45, \"capacity_bytes\": 48318382080, \"used_bytes\": 2048,"
            " \"last_checked\": \"2024-05-01T10:00:00Z\", \"simulated_failure\": false}");

        StorageNode node = StorageNode::fromJson(obj, IngestDefaults::NODE_CAPACITY_BYTES);
        ASSERT_THAT(node.id == "node-2");
        ASSERT_THAT(node.isOnline());
        ASSERT_THAT(!node.simulatedFailure);
        ASSERT_THAT(node.stats.capacityBytes == 48318382080ull);
        ASSERT_THAT(node.stats.usedBytes == 2048);
        ASSERT_THAT(node.stats.fileCount == 3);
        ASSERT_THAT(node.availableBytes() == 48318382080ull - 2048);

        json::value failed = json::value::parse(
            "{\"node_id\": \"node-3\", \"status\": \"offline\", \"capacity_gb\": 60, \"simulated_failure\": true}");
        StorageNode failedNode = StorageNode::fromJson(failed, IngestDefaults::NODE_CAPACITY_BYTES);
        ASSERT_THAT(failedNode.state == NodeState::SimulatedFailure);
        ASSERT_THAT(failedNode.simulatedFailure);
        ASSERT_THAT(failedNode.stats.capacityBytes == 60ull * IngestDefaults::BYTES_PER_GB);
        ASSERT_THAT(failedNode.availableBytes() == failedNode.stats.capacityBytes);

        bool threw = false;
        try
        {
            StorageNode::fromJson(json::value::parse("{\"status\": \"online\"}"), 0);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        ASSERT_THAT(threw);
    }

    void testNodeDefaults()
    {
        json::value bare = json::value::parse("{\"node_id\": \"node-9\", \"status\": \"online\"}");

        StorageNode node = StorageNode::fromJson(bare, IngestDefaults::NODE_CAPACITY_BYTES);
        ASSERT_THAT(node.stats.capacityBytes == IngestDefaults::NODE_CAPACITY_BYTES);
        ASSERT_THAT(node.stats.usedBytes == 0);
        ASSERT_THAT(node.stats.fileCount == 0);
        ASSERT_THAT(node.utilizationPercent() == 0.0);

        // configured default wins over the built-in one
        StorageNode configured = StorageNode::fromJson(bare, 1000);
        ASSERT_THAT(configured.stats.capacityBytes == 1000);
    }

    void testSnapshotFromJson()
    {
        json::value response = json::value::parse(
            "{\"total_nodes\": 3, \"online_nodes\": 2, \"nodes\": ["
            " {\"node_id\": \"node-1\", \"status\": \"online\"},"
            " {\"node_id\": \"node-2\", \"status\": \"offline\", \"simulated_failure\": true},"
            " {\"status\": \"online\"},"
            " {\"node_id\": \"node-3\", \"status\": \"online\"}"
            "]}");

        NodeRegistrySnapshot snapshot = NodeRegistrySnapshot::fromJson(response);
        ASSERT_THAT(snapshot.nodes.size() == 3);
        ASSERT_THAT(snapshot.reportedTotalNodes == 3);
        ASSERT_THAT(snapshot.reportedOnlineNodes == 2);
        ASSERT_THAT(snapshot.isOnline("node-1"));
        ASSERT_THAT(!snapshot.isOnline("node-2"));
        ASSERT_THAT(!snapshot.isOnline("node-404"));
        ASSERT_THAT(snapshot.find("node-404") == nullptr);

        bool threw = false;
        try
        {
            NodeRegistrySnapshot::fromJson(json::value::parse("{\"total_nodes\": 0}"));
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        ASSERT_THAT(threw);
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "StorageNode Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testNodeFromJson),
            TEST(testNodeDefaults),
            TEST(testSnapshotFromJson)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
