#include <cpprest/json.h>
#include <pplx/pplxtasks.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <map>
#include <functional>

#include "monitor_config.hpp"
#include "http_cluster_service.hpp"
#include "monitor_session.hpp"
#include "encoding_scheme.hpp"
#include "utils.hpp"

/**
 * Interactive operator console over a MonitorSession.
 */
class Console
{
private:
    MonitorConfig config;
    HttpClusterService service;
    MonitorSession session;

    using Handler = std::function<void(const std::vector<std::string> &)>;

    /**
     * Mapping is of the form: { command -> (usage, handler) }.
     */
    std::map<std::string, std::pair<std::string, Handler>> commands;

    bool running;

    static const int COLUMN_WIDTH = 14;

public:
    Console(std::string configFilePath)
        : config(configFilePath),
          service(config.serviceUrl, config.requestTimeoutMs, config.defaultNodeCapacityBytes),
          session(service, config.pollPeriodMs, config.downloadDirPath),
          running(false)
    {
        registerCommands();
    }

    /**
     * Starts polling and reads commands from stdin until `quit` or EOF.
     */
    void start()
    {
        std::cout << "shardwatch monitoring " << config.serviceUrl
                  << " (polling every " << config.pollPeriodMs << " ms)" << std::endl;
        std::cout << "type 'help' for a list of commands" << std::endl;

        session.startPolling();
        running = true;

        std::string line;
        while (running)
        {
            std::cout << "> " << std::flush;
            if (!std::getline(std::cin, line))
                break;

            std::vector<std::string> words = StringUtils::splitWords(line);
            if (words.empty())
                continue;

            router(words);
        }

        session.stopPolling();
    }

private:
    void registerCommands()
    {
        auto bind = [this](void (Console::*handler)(const std::vector<std::string> &))
        {
            return [this, handler](const std::vector<std::string> &args) { (this->*handler)(args); };
        };

        commands["nodes"]       = {"nodes", bind(&Console::nodesHandler)};
        commands["files"]       = {"files", bind(&Console::filesHandler)};
        commands["status"]      = {"status <file>", bind(&Console::statusHandler)};
        commands["verify"]      = {"verify <file>", bind(&Console::verifyHandler)};
        commands["fail"]        = {"fail <node>", bind(&Console::failHandler)};
        commands["restore"]     = {"restore <node>", bind(&Console::restoreHandler)};
        commands["restore-all"] = {"restore-all", bind(&Console::restoreAllHandler)};
        commands["failures"]    = {"failures", bind(&Console::failuresHandler)};
        commands["reconstruct"] = {"reconstruct <file>", bind(&Console::reconstructHandler)};
        commands["delete"]      = {"delete <file>", bind(&Console::deleteHandler)};
        commands["poll"]        = {"poll", bind(&Console::pollHandler)};
        commands["help"]        = {"help", bind(&Console::helpHandler)};
        commands["quit"]        = {"quit", bind(&Console::quitHandler)};
    }

    /**
     * Dispatches a command line to its handler.
     *
     * NOTE:
     *
     * Service failures are reported here and never end the console.
     */
    void router(const std::vector<std::string> &words)
    {
        std::string command = StringUtils::toLower(words[0]);
        std::vector<std::string> args(words.begin() + 1, words.end());

        auto it = commands.find(command);
        if (it == commands.end())
        {
            std::cout << "unknown command: " << command << " (try 'help')" << std::endl;
            return;
        }

        // commands of the form "<verb> <id>" need exactly one argument
        const std::string &usage = it->second.first;
        bool needsArg = usage.find('<') != std::string::npos;
        if (needsArg != !args.empty() || args.size() > 1)
        {
            std::cout << "usage: " << usage << std::endl;
            return;
        }

        try
        {
            it->second.second(args);
        }
        catch (const ClusterError &e)
        {
            std::cout << "error (" << toString(e.kind()) << "): " << e.what() << std::endl;
        }
        catch (const std::exception &e)
        {
            std::cout << "error: " << e.what() << std::endl;
        }
    }

    /**
     * Asks a yes/no question, defaulting to no.
     */
    static bool confirm(const std::string &question)
    {
        std::cout << question << " [y/N] " << std::flush;

        std::string answer;
        if (!std::getline(std::cin, answer))
            return false;

        answer = StringUtils::toLower(answer);
        return answer == "y" || answer == "yes";
    }

    ////////////////////////////////////////////
    // Read-only commands
    ////////////////////////////////////////////

    void nodesHandler(const std::vector<std::string> &)
    {
        std::shared_ptr<const ClusterSnapshot> snap = session.snapshot();
        if (!snap->nodesAvailable)
            std::cout << "node registry unavailable in the latest poll" << std::endl;

        std::cout << createNodesDisplay(*snap).str();

        ClusterHealthSummary summary = session.clusterSummary();
        std::cout << "cluster health: " << summary.healthLabel << " (" << summary.healthScore << "/100), "
                  << summary.onlineNodes << " of " << summary.totalNodes << " nodes online" << std::endl;
    }

    void filesHandler(const std::vector<std::string> &)
    {
        std::shared_ptr<const ClusterSnapshot> snap = session.snapshot();
        if (!snap->filesAvailable)
            std::cout << "file catalog unavailable in the latest poll" << std::endl;

        std::cout << createFilesDisplay(session.fileStatuses()).str();

        ClusterUsage usage = session.clusterUsage();
        std::ostringstream overhead;
        overhead.precision(2);
        overhead << std::fixed << usage.averageOverhead;

        std::cout << usage.totalFiles << " files, "
                  << PrintUtils::formatNumBytes(usage.usedBytes) << " of "
                  << PrintUtils::formatNumBytes(usage.capacityBytes) << " used ("
                  << PrintUtils::formatPercent(usage.utilizationPercent) << "), average overhead "
                  << overhead.str() << "x" << std::endl;
    }

    void statusHandler(const std::vector<std::string> &args)
    {
        const std::string &fileId = args[0];

        std::shared_ptr<const ClusterSnapshot> snap = session.snapshot();
        const FileRecord *file = snap->findFile(fileId);
        if (!file)
        {
            std::cout << "file " << fileId << " is not in the current snapshot" << std::endl;
            return;
        }

        FileHealthStatus status = HealthEvaluator::evaluate(*file, snap->nodes);

        std::cout << file->filename << " (" << file->id << "), "
                  << PrintUtils::formatNumBytes(file->originalSizeBytes) << std::endl;
        std::cout << "scheme:        "
                  << (file->scheme ? Schemes::describe(*file->scheme) : file->algorithm + " (unknown)")
                  << (file->compressed ? ", compressed" : "") << std::endl;
        std::cout << "health:        " << toString(status.health) << std::endl;
        std::cout << "shards online: " << status.onlineShards << " of " << status.totalShards
                  << " (" << status.neededShards << " needed)" << std::endl;
        std::cout << "reconstructable: " << (status.reconstructable ? "yes" : "no")
                  << ", survives " << status.canSurviveMore << " more node failure(s)" << std::endl;

        if (!status.issue.empty())
            std::cout << "issue:         " << status.issue << std::endl;

        if (!status.missingShardIndices.empty())
            std::cout << "missing:       " << PrintUtils::joinVector(status.missingShardIndices) << std::endl;

        std::cout << createShardsDisplay(status).str();
    }

    void verifyHandler(const std::vector<std::string> &args)
    {
        ConsistencyReport report = session.verifyFileStatus(args[0]).get();
        if (report.consistent())
        {
            std::cout << args[0] << ": local status agrees with the service" << std::endl;
            return;
        }

        std::cout << args[0] << ": " << report.mismatches.size() << " mismatch(es)" << std::endl;
        for (const std::string &mismatch : report.mismatches)
            std::cout << "  " << mismatch << std::endl;
    }

    void failuresHandler(const std::vector<std::string> &)
    {
        FailureInfo info = session.failureInfo().get();
        if (info.failedNodes.empty())
        {
            std::cout << "no nodes in simulated failure" << std::endl;
            return;
        }

        std::cout << info.failureCount << " node(s) in simulated failure:" << std::endl;
        for (const std::string &nodeId : info.failedNodes)
        {
            auto since = info.failureHistory.find(nodeId);
            std::cout << "  " << nodeId;
            if (since != info.failureHistory.end())
                std::cout << " since " << since->second;
            std::cout << std::endl;
        }
    }

    ////////////////////////////////////////////
    // Commands
    ////////////////////////////////////////////

    void failHandler(const std::vector<std::string> &args)
    {
        printToggleResult(session.simulateFailure(args[0]).get());
    }

    void restoreHandler(const std::vector<std::string> &args)
    {
        printToggleResult(session.restore(args[0]).get());
    }

    void restoreAllHandler(const std::vector<std::string> &)
    {
        std::vector<ToggleResult> results = session.restoreAll().get();
        if (results.empty())
            std::cout << "no nodes to restore" << std::endl;

        for (const ToggleResult &result : results)
            printToggleResult(result);
    }

    void reconstructHandler(const std::vector<std::string> &args)
    {
        ReconstructionResult result = session.reconstruct(args[0], [](const ReconstructionInfo &info)
        {
            std::cout << "reconstruct " << info.filename << ": "
                      << info.availableShards << " of " << info.totalShards << " shards available, "
                      << info.neededShards << " needed, original size "
                      << PrintUtils::formatNumBytes(info.originalSizeBytes) << std::endl;
            return confirm("download the reconstructed file?");
        }).get();

        if (result.rejected)
        {
            std::cout << result.message << std::endl;
            return;
        }

        std::cout << toString(result.state) << ": " << result.message << std::endl;
        if (result.state == ReconstructionState::Saved)
            std::cout << "sha256: " << result.sha256 << std::endl;
        else if (result.state == ReconstructionState::Blocked && !result.info.missingShardIndices.empty())
            std::cout << "missing shards: " << PrintUtils::joinVector(result.info.missingShardIndices) << std::endl;
    }

    void deleteHandler(const std::vector<std::string> &args)
    {
        const std::string &fileId = args[0];
        if (!confirm("delete " + fileId + " and all of its shards?"))
            return;

        DeleteResult result = session.deleteFile(fileId).get();
        std::cout << toString(result.outcome) << ": " << result.message << std::endl;
        for (const std::string &error : result.shardErrors)
            std::cout << "  " << error << std::endl;
    }

    void pollHandler(const std::vector<std::string> &)
    {
        PollReport report = session.poll();
        if (report.ok())
            std::cout << "snapshot " << report.generation << " published" << std::endl;
        else
            std::cout << "snapshot " << report.generation << " published with "
                      << report.errors.size() << " error(s)" << std::endl;
    }

    void helpHandler(const std::vector<std::string> &)
    {
        std::cout << "commands:" << std::endl;
        for (const auto &[name, command] : commands)
            std::cout << "  " << command.first << std::endl;
    }

    void quitHandler(const std::vector<std::string> &)
    {
        running = false;
    }

    ////////////////////////////////////////////
    // Displays
    ////////////////////////////////////////////

    static void printToggleResult(const ToggleResult &result)
    {
        std::cout << result.nodeId << " -> " << toString(result.targetState) << ": "
                  << toString(result.outcome);
        if (!result.message.empty())
            std::cout << " (" << result.message << ")";
        std::cout << std::endl;
    }

    /**
     * Creates the table of every node in `snap`.
     */
    static std::ostringstream createNodesDisplay(const ClusterSnapshot &snap)
    {
        std::ostringstream oss;
        std::vector<std::string> header = {"Node", "Status", "Files", "Used", "Capacity", "Usage", "Last check"};

        oss << PrintUtils::tableDivider(header.size(), COLUMN_WIDTH);
        oss << PrintUtils::tableRow(header, COLUMN_WIDTH);
        oss << PrintUtils::tableDivider(header.size(), COLUMN_WIDTH, true);

        for (const auto &[nodeId, node] : snap.nodes.nodes)
        {
            std::string lastChecked = node.lastChecked.is_initialized()
                ? node.lastChecked.to_string(utility::datetime::ISO_8601)
                : "-";

            oss << PrintUtils::tableRow({
                nodeId,
                toString(node.state),
                std::to_string(node.stats.fileCount),
                PrintUtils::formatNumBytes(node.stats.usedBytes),
                PrintUtils::formatNumBytes(node.stats.capacityBytes),
                PrintUtils::formatPercent(node.utilizationPercent()),
                lastChecked
            }, COLUMN_WIDTH);
        }

        oss << PrintUtils::tableDivider(header.size(), COLUMN_WIDTH);
        return oss;
    }

    /**
     * Creates the table of every file and its derived status.
     */
    static std::ostringstream createFilesDisplay(const std::vector<FileView> &views)
    {
        std::ostringstream oss;
        std::vector<std::string> header = {"File id", "Filename", "Algorithm", "Online", "Needed", "Health"};

        oss << PrintUtils::tableDivider(header.size(), COLUMN_WIDTH);
        oss << PrintUtils::tableRow(header, COLUMN_WIDTH);
        oss << PrintUtils::tableDivider(header.size(), COLUMN_WIDTH, true);

        for (const FileView &view : views)
        {
            oss << PrintUtils::tableRow({
                view.file.id,
                view.file.filename,
                view.file.algorithm,
                std::to_string(view.status.onlineShards) + "/" + std::to_string(view.status.totalShards),
                view.file.scheme ? std::to_string(view.status.neededShards) : "?",
                toString(view.status.health)
            }, COLUMN_WIDTH);
        }

        oss << PrintUtils::tableDivider(header.size(), COLUMN_WIDTH);
        return oss;
    }

    /**
     * Creates the table of a file's shards and where they live.
     */
    static std::ostringstream createShardsDisplay(const FileHealthStatus &status)
    {
        std::ostringstream oss;
        std::vector<std::string> header = {"Shard", "Node", "Status", "Size"};

        oss << PrintUtils::tableDivider(header.size(), COLUMN_WIDTH);
        oss << PrintUtils::tableRow(header, COLUMN_WIDTH);
        oss << PrintUtils::tableDivider(header.size(), COLUMN_WIDTH, true);

        for (const ShardStatus &shard : status.shardStatus)
        {
            oss << PrintUtils::tableRow({
                std::to_string(shard.index),
                shard.nodeId,
                shard.online ? "online" : "offline",
                PrintUtils::formatNumBytes(shard.sizeBytes)
            }, COLUMN_WIDTH);
        }

        oss << PrintUtils::tableDivider(header.size(), COLUMN_WIDTH);
        return oss;
    }
};

////////////////////////////////////////////
// Run
////////////////////////////////////////////

int run(std::string configFilePath)
{
    try
    {
        Console console(configFilePath);
        console.start();
    }
    catch (const std::exception &e)
    {
        std::cerr << "shardwatch: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char *argv[])
{
    std::string configFilePath = argc > 1 ? argv[1] : "config.json";
    return run(configFilePath);
}
