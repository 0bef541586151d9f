#include <algorithm>

#include "mock_cluster_service.hpp"
#include "health_evaluator.hpp"

namespace
{
    ClusterError injected(ClusterErrorKind kind, const std::string &what)
    {
        int status = 0;
        if (kind == ClusterErrorKind::Server)
            status = 500;
        else if (kind == ClusterErrorKind::Client)
            status = 404;
        return ClusterError(kind, "injected " + toString(kind) + " failure: " + what, status);
    }
}

const char *const MockClusterService::FETCHES = "fetches";

MockClusterService::MockClusterService(NodeRegistrySnapshot nodes, std::vector<FileRecord> files)
    : nodeSnapshot(std::move(nodes)),
      fileList(std::move(files)),
      numNodeFetches(0),
      numFileFetches(0),
      numToggles(0),
      numDownloads(0),
      numDeletes(0)
{
}

template<typename T>
pplx::task<T> MockClusterService::gated(const std::string &id, std::function<T()> work)
{
    std::lock_guard<std::mutex> lock(mutex);
    auto gate = gates.find(id);
    if (gate == gates.end())
        return pplx::create_task(work);

    return pplx::create_task(gate->second).then(work);
}

template<typename T>
pplx::task<T> MockClusterService::respond(const std::string &id, T value)
{
    auto gate = gates.find(id);
    if (gate == gates.end())
        return pplx::task_from_result(std::move(value));

    return pplx::create_task(gate->second).then([value]() { return value; });
}

pplx::task<NodeRegistrySnapshot> MockClusterService::fetchNodes()
{
    std::lock_guard<std::mutex> lock(mutex);
    numNodeFetches++;
    if (nodeFetchFailure)
        return pplx::task_from_exception<NodeRegistrySnapshot>(injected(*nodeFetchFailure, "GET /nodes/status"));
    return respond(FETCHES, nodeSnapshot);
}

pplx::task<std::vector<FileRecord>> MockClusterService::fetchFiles()
{
    std::lock_guard<std::mutex> lock(mutex);
    numFileFetches++;
    if (fileFetchFailure)
        return pplx::task_from_exception<std::vector<FileRecord>>(injected(*fileFetchFailure, "GET /files"));
    return respond(FETCHES, fileList);
}

pplx::task<ReportedFileStatus> MockClusterService::fetchFileStatus(const std::string &fileId)
{
    std::lock_guard<std::mutex> lock(mutex);
    const FileRecord *file = findFile(fileId);
    if (!file)
    {
        return pplx::task_from_exception<ReportedFileStatus>(
            ClusterError(ClusterErrorKind::Client, "File " + fileId + " not found", 404));
    }

    auto reported = reportedStatuses.find(fileId);
    if (reported != reportedStatuses.end())
        return pplx::task_from_result(reported->second);

    FileHealthStatus local = HealthEvaluator::evaluate(*file, nodeSnapshot);
    ReportedFileStatus status;
    status.onlineShards = local.onlineShards;
    status.neededShards = local.neededShards;
    status.canSurviveMore = local.canSurviveMore;
    status.reconstructable = local.reconstructable;
    status.health = toString(local.health);
    return pplx::task_from_result(status);
}

pplx::task<ReconstructionInfo> MockClusterService::fetchReconstructInfo(const std::string &fileId)
{
    std::lock_guard<std::mutex> lock(mutex);
    const FileRecord *file = findFile(fileId);
    if (!file)
    {
        return pplx::task_from_exception<ReconstructionInfo>(
            ClusterError(ClusterErrorKind::Client, "File " + fileId + " not found", 404));
    }
    return pplx::task_from_result(HealthEvaluator::reconstructionInfo(*file, nodeSnapshot));
}

pplx::task<std::vector<unsigned char>> MockClusterService::downloadReconstruction(const std::string &fileId)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        numDownloads++;
    }

    return gated<std::vector<unsigned char>>(fileId, [this, fileId]()
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto failure = downloadFailures.find(fileId);
        if (failure != downloadFailures.end())
            std::rethrow_exception(failure->second);

        const FileRecord *file = findFile(fileId);
        if (!file)
            throw ClusterError(ClusterErrorKind::Client, "File " + fileId + " not found", 404);

        ReconstructionInfo info = HealthEvaluator::reconstructionInfo(*file, nodeSnapshot);
        if (!info.canReconstruct)
        {
            throw ClusterError(
                ClusterErrorKind::Server, 
                "Reconstruction failed: insufficient shards (" + std::to_string(info.availableShards) 
                    + " available, " + std::to_string(info.neededShards) + " needed)", 
                500);
        }

        auto payload = payloads.find(fileId);
        if (payload != payloads.end())
            return payload->second;
        return std::vector<unsigned char>(file->filename.begin(), file->filename.end());
    });
}

pplx::task<DeleteReport> MockClusterService::deleteFile(const std::string &fileId)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        numDeletes++;
    }

    return gated<DeleteReport>(fileId, [this, fileId]()
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto file = std::find_if(fileList.begin(), fileList.end(), 
            [&fileId](const FileRecord &record) { return record.id == fileId; });
        if (file == fileList.end())
            throw ClusterError(ClusterErrorKind::Client, "File " + fileId + " not found", 404);

        DeleteReport report;
        report.fileId = fileId;
        report.shardsDeleted = static_cast<uint32_t>(file->shards.size());
        fileList.erase(file);
        return report;
    });
}

pplx::task<ToggleAck> MockClusterService::simulateFailure(const std::string &nodeId)
{
    return gated<ToggleAck>(nodeId, [this, nodeId]() 
    { 
        return applyToggle(nodeId, NodeState::SimulatedFailure); 
    });
}

pplx::task<ToggleAck> MockClusterService::restoreNode(const std::string &nodeId)
{
    return gated<ToggleAck>(nodeId, [this, nodeId]() 
    { 
        return applyToggle(nodeId, NodeState::Online); 
    });
}

ToggleAck MockClusterService::applyToggle(const std::string &nodeId, NodeState target)
{
    std::lock_guard<std::mutex> lock(mutex);
    numToggles++;

    auto failure = toggleFailures.find(nodeId);
    if (failure != toggleFailures.end())
        throw injected(failure->second, "toggle " + nodeId);

    auto node = nodeSnapshot.nodes.find(nodeId);
    if (node == nodeSnapshot.nodes.end())
        throw ClusterError(ClusterErrorKind::Client, "Node " + nodeId + " not found", 404);

    bool failing = target == NodeState::SimulatedFailure;
    ToggleAck ack;
    if (node->second.state == target)
    {
        ack.changed = false;
        ack.status = failing ? "already_failed" : "already_online";
        ack.message = "Node " + nodeId + (failing ? " is already failed" : " was not failed");
        return ack;
    }

    node->second.state = target;
    node->second.simulatedFailure = failing;
    if (failing)
    {
        nodeSnapshot.reportedOnlineNodes--;
        failureHistory[nodeId] = "2024-01-01T00:00:00";
    }
    else
    {
        nodeSnapshot.reportedOnlineNodes++;
        failureHistory.erase(nodeId);
    }

    ack.changed = true;
    ack.status = failing ? "failed" : "online";
    ack.message = "Node " + nodeId + (failing ? " failure simulated" : " restored");
    return ack;
}

pplx::task<FailureInfo> MockClusterService::fetchFailures()
{
    std::lock_guard<std::mutex> lock(mutex);
    FailureInfo info;
    for (const auto &[nodeId, node] : nodeSnapshot.nodes)
    {
        if (node.simulatedFailure)
            info.failedNodes.push_back(nodeId);
    }
    info.failureCount = static_cast<uint32_t>(info.failedNodes.size());
    info.failureHistory = failureHistory;
    return pplx::task_from_result(info);
}

void MockClusterService::failNodeFetches(std::optional<ClusterErrorKind> kind)
{
    std::lock_guard<std::mutex> lock(mutex);
    nodeFetchFailure = kind;
}

void MockClusterService::failFileFetches(std::optional<ClusterErrorKind> kind)
{
    std::lock_guard<std::mutex> lock(mutex);
    fileFetchFailure = kind;
}

void MockClusterService::failToggles(const std::string &nodeId, ClusterErrorKind kind)
{
    std::lock_guard<std::mutex> lock(mutex);
    toggleFailures[nodeId] = kind;
}

void MockClusterService::failDownloads(const std::string &fileId, std::exception_ptr error)
{
    std::lock_guard<std::mutex> lock(mutex);
    downloadFailures[fileId] = error;
}

void MockClusterService::reportStatus(const std::string &fileId, ReportedFileStatus status)
{
    std::lock_guard<std::mutex> lock(mutex);
    reportedStatuses[fileId] = status;
}

void MockClusterService::setPayload(const std::string &fileId, std::vector<unsigned char> payload)
{
    std::lock_guard<std::mutex> lock(mutex);
    payloads[fileId] = std::move(payload);
}

void MockClusterService::hold(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex);
    gates[id] = pplx::task_completion_event<void>();
}

void MockClusterService::release(const std::string &id)
{
    pplx::task_completion_event<void> gate;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = gates.find(id);
        if (it == gates.end())
            return;
        gate = it->second;
        gates.erase(it);
    }
    gate.set();
}

void MockClusterService::removeNode(const std::string &nodeId)
{
    std::lock_guard<std::mutex> lock(mutex);
    nodeSnapshot.nodes.erase(nodeId);
}

NodeRegistrySnapshot MockClusterService::nodes() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return nodeSnapshot;
}

uint32_t MockClusterService::nodeFetches() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return numNodeFetches;
}

uint32_t MockClusterService::fileFetches() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return numFileFetches;
}

uint32_t MockClusterService::toggleCalls() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return numToggles;
}

uint32_t MockClusterService::downloadCalls() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return numDownloads;
}

uint32_t MockClusterService::deleteCalls() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return numDeletes;
}

const FileRecord *MockClusterService::findFile(const std::string &fileId) const
{
    for (const FileRecord &file : fileList)
    {
        if (file.id == fileId)
            return &file;
    }
    return nullptr;
}
