#include <iostream>
#include <fstream>
#include <functional>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>
#include <exception>

#include "reconstruction.hpp"
#include "mock_cluster_service.hpp"
#include "crypto.hpp"
#include "utils.hpp"
#include "test_utils.hpp"
#include "test_fixtures.hpp"

std::string toString(ReconstructionState state)
{
    switch (state)
    {
        case ReconstructionState::Idle:         return "idle";
        case ReconstructionState::FetchingInfo: return "fetching info";
        case ReconstructionState::InfoReady:    return "info ready";
        case ReconstructionState::Downloading:  return "downloading";
        case ReconstructionState::Saved:        return "saved";
        case ReconstructionState::Blocked:      return "blocked";
        case ReconstructionState::Cancelled:    return "cancelled";
        case ReconstructionState::Failed:       return "failed";
    }
    return "unknown";
}

ReconstructionResult::ReconstructionResult()
    : state(ReconstructionState::Idle),
      savedBytes(0),
      rejected(false)
{
}

ReconstructionOrchestrator::ReconstructionOrchestrator(
    ClusterService &service, 
    InFlightRegistry &fileOps, 
    std::string downloadDirPath
)
    : service(service),
      fileOps(fileOps),
      downloadDirPath(downloadDirPath)
{
    // expand '~' to the home directory if present
    if (!downloadDirPath.empty() && downloadDirPath[0] == '~')
    {
        const char* homeDir = std::getenv("HOME");
        if (homeDir)
            this->downloadDirPath = fs::path(homeDir) / downloadDirPath.substr(std::min<size_t>(2, downloadDirPath.size()));
    }
}

pplx::task<ReconstructionResult> ReconstructionOrchestrator::reconstruct(const std::string &fileId, Confirmation confirm)
{
    std::shared_ptr<InFlightRegistry::Guard> guard = fileOps.acquire(fileId);
    if (!guard)
    {
        ReconstructionResult result;
        result.fileId = fileId;
        result.state = state(fileId);
        result.rejected = true;
        result.message = "an operation on file " + fileId + " is already in flight";
        return pplx::task_from_result(result);
    }

    setState(fileId, ReconstructionState::FetchingInfo);

    return service.fetchReconstructInfo(fileId)
    .then([this, guard, fileId, confirm](pplx::task<ReconstructionInfo> infoTask)
    {
        ReconstructionResult result;
        result.fileId = fileId;

        auto finish = [this, guard](ReconstructionResult result, ReconstructionState state)
        {
            result.state = state;
            setState(result.fileId, state);
            guard->release();
            return pplx::task_from_result(result);
        };

        try
        {
            result.info = infoTask.get();
        }
        catch (const ClusterError &e)
        {
            result.errorKind = e.kind();
            result.message = e.what();
            return finish(result, ReconstructionState::Failed);
        }
        catch (const std::exception &e)
        {
            result.message = e.what();
            return finish(result, ReconstructionState::Failed);
        }

        if (!result.info.canReconstruct)
        {
            result.message = "cannot reconstruct: " + std::to_string(result.info.availableShards) 
                + " of " + std::to_string(result.info.neededShards) + " needed shards available ("
                + std::to_string(result.info.shortfall()) + " short)";
            std::cout << "[reconstruct] " << fileId << " blocked, " << result.message << std::endl;
            return finish(result, ReconstructionState::Blocked);
        }

        setState(fileId, ReconstructionState::InfoReady);
        if (confirm && !confirm(result.info))
        {
            result.message = "reconstruction of " + fileId + " cancelled";
            return finish(result, ReconstructionState::Cancelled);
        }

        setState(fileId, ReconstructionState::Downloading);
        return service.downloadReconstruction(fileId)
        .then([this, guard, result](pplx::task<std::vector<unsigned char>> downloadTask) mutable
        {
            ReconstructionState finalState = ReconstructionState::Failed;
            try
            {
                std::vector<unsigned char> payload = downloadTask.get();

                std::string filename = result.info.filename.empty() ? result.fileId : result.info.filename;
                result.savedPath = save(filename, payload);
                result.savedBytes = payload.size();
                result.sha256 = Crypto::sha256Hex(payload);
                result.message = "saved " + PrintUtils::formatNumBytes(result.savedBytes) 
                    + " to " + result.savedPath.string();

                if (result.info.originalSizeBytes != 0 && result.savedBytes != result.info.originalSizeBytes)
                {
                    std::cout << "[reconstruct] " << result.fileId << " payload is " << result.savedBytes 
                              << " bytes, catalog records " << result.info.originalSizeBytes << std::endl;
                }

                finalState = ReconstructionState::Saved;
            }
            catch (const ClusterError &e)
            {
                result.errorKind = e.kind();
                result.message = e.what();
            }
            catch (const std::exception &e)
            {
                result.message = e.what();
            }

            result.state = finalState;
            setState(result.fileId, finalState);
            guard->release();

            std::cout << "[reconstruct] " << result.fileId << " " << toString(finalState) 
                      << ": " << result.message << std::endl;
            return result;
        });
    });
}

ReconstructionState ReconstructionOrchestrator::state(const std::string &fileId) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = states.find(fileId);
    return it == states.end() ? ReconstructionState::Idle : it->second;
}

void ReconstructionOrchestrator::setState(const std::string &fileId, ReconstructionState state)
{
    std::lock_guard<std::mutex> lock(mutex);
    states[fileId] = state;
}

fs::path ReconstructionOrchestrator::save(const std::string &filename, const std::vector<unsigned char> &payload)
{
    // only keep the final path component of the catalog filename
    fs::path target = downloadDirPath / fs::path(filename).filename();

    std::error_code ec;
    fs::create_directories(downloadDirPath, ec);
    if (ec)
        throw std::runtime_error("couldn't create download directory " + downloadDirPath.string() + ": " + ec.message());

    std::ofstream out(target, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open())
        throw std::runtime_error("failed to open " + target.string() + " for writing!");

    out.write(reinterpret_cast<const char*>(payload.data()), payload.size());
    if (!out)
        throw std::runtime_error("bad write of reconstructed payload to " + target.string());

    return target;
}

////////////////////////////////////////////
// ReconstructionOrchestrator tests
////////////////////////////////////////////
namespace ReconstructionTests
{
    namespace
    {
        fs::path scratchDir(const std::string &name)
        {
            fs::path dir = fs::temp_directory_path() / ("shardwatch_test_" + name);
            fs::remove_all(dir);
            return dir;
        }
    }

    void testSaved()
    {
        FileRecord file = Fixtures::makeSpreadFile("doc", ReedSolomon{4, 2});
        MockClusterService service(Fixtures::makeNodes(6, {"node-5"}), {file});
        service.setPayload("doc", {'a', 'b', 'c'});

        fs::path dir = scratchDir("saved");
        InFlightRegistry fileOps;
        ReconstructionOrchestrator orchestrator(service, fileOps, dir.string());

        bool asked = false;
        ReconstructionResult result = orchestrator.reconstruct("doc", [&asked](const ReconstructionInfo &info) 
        {
            asked = true;
            return info.availableShards == 5;
        }).get();

        ASSERT_THAT(asked);
        ASSERT_THAT(result.state == ReconstructionState::Saved);
        ASSERT_THAT(orchestrator.state("doc") == ReconstructionState::Saved);
        ASSERT_THAT(result.savedBytes == 3);
        ASSERT_THAT(result.savedPath == dir / "doc.bin");
        ASSERT_THAT(fs::file_size(result.savedPath) == 3);
        ASSERT_THAT(result.sha256 == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        ASSERT_THAT(!fileOps.isInFlight("doc"));

        fs::remove_all(dir);
    }

    void testBlockedNeverDownloads()
    {
        FileRecord file = Fixtures::makeSpreadFile("doc", ReedSolomon{4, 2});
        MockClusterService service(Fixtures::makeNodes(6, {"node-1", "node-2", "node-3"}), {file});

        InFlightRegistry fileOps;
        ReconstructionOrchestrator orchestrator(service, fileOps, scratchDir("blocked").string());

        bool asked = false;
        ReconstructionResult result = orchestrator.reconstruct("doc", [&asked](const ReconstructionInfo &) 
        {
            asked = true;
            return true;
        }).get();

        ASSERT_THAT(result.state == ReconstructionState::Blocked);
        ASSERT_THAT(result.info.shortfall() == 1);
        ASSERT_THAT(!asked);
        ASSERT_THAT(service.downloadCalls() == 0);
        ASSERT_THAT(!fileOps.isInFlight("doc"));
    }

    void testCancelled()
    {
        FileRecord file = Fixtures::makeSpreadFile("doc", Replication{3});
        MockClusterService service(Fixtures::makeNodes(3), {file});

        InFlightRegistry fileOps;
        ReconstructionOrchestrator orchestrator(service, fileOps, scratchDir("cancelled").string());

        ReconstructionResult result = orchestrator.reconstruct("doc", [](const ReconstructionInfo &) 
        { 
            return false; 
        }).get();

        ASSERT_THAT(result.state == ReconstructionState::Cancelled);
        ASSERT_THAT(service.downloadCalls() == 0);
        ASSERT_THAT(!fileOps.isInFlight("doc"));
    }

    void testConcurrentAttemptRejected()
    {
        FileRecord file = Fixtures::makeSpreadFile("doc", Replication{2});
        MockClusterService service(Fixtures::makeNodes(2), {file});

        fs::path dir = scratchDir("concurrent");
        InFlightRegistry fileOps;
        ReconstructionOrchestrator orchestrator(service, fileOps, dir.string());
        auto approve = [](const ReconstructionInfo &) { return true; };

        service.hold("doc");
        pplx::task<ReconstructionResult> first = orchestrator.reconstruct("doc", approve);

        ReconstructionResult second = orchestrator.reconstruct("doc", approve).get();
        ASSERT_THAT(second.rejected);

        service.release("doc");
        ASSERT_THAT(first.get().state == ReconstructionState::Saved);
        ASSERT_THAT(service.downloadCalls() == 1);

        fs::remove_all(dir);
    }

    void testDownloadFailure()
    {
        FileRecord file = Fixtures::makeSpreadFile("doc", Replication{2});
        MockClusterService service(Fixtures::makeNodes(2), {file});
        auto approve = [](const ReconstructionInfo &) { return true; };

        InFlightRegistry fileOps;
        ReconstructionOrchestrator orchestrator(service, fileOps, scratchDir("broken").string());

        service.failDownloads("doc", std::make_exception_ptr(
            ClusterError(ClusterErrorKind::Timeout, "GET /file/doc/reconstruct timed out")));
        ReconstructionResult timedOut = orchestrator.reconstruct("doc", approve).get();
        ASSERT_THAT(timedOut.state == ReconstructionState::Failed);
        ASSERT_THAT(timedOut.errorKind == ClusterErrorKind::Timeout);
        ASSERT_THAT(orchestrator.state("doc") == ReconstructionState::Failed);
        ASSERT_THAT(!fileOps.isInFlight("doc"));

        // a failure outside the ClusterError hierarchy still ends the attempt
        service.failDownloads("doc", std::make_exception_ptr(std::logic_error("connection reset")));
        ReconstructionResult dropped = orchestrator.reconstruct("doc", approve).get();
        ASSERT_THAT(dropped.state == ReconstructionState::Failed);
        ASSERT_THAT(!dropped.errorKind.has_value());
        ASSERT_THAT(dropped.message == "connection reset");
        ASSERT_THAT(orchestrator.state("doc") == ReconstructionState::Failed);
        ASSERT_THAT(!fileOps.isInFlight("doc"));
        ASSERT_THAT(service.downloadCalls() == 2);
    }

    void testInfoFailure()
    {
        MockClusterService service(Fixtures::makeNodes(2), {});

        InFlightRegistry fileOps;
        ReconstructionOrchestrator orchestrator(service, fileOps, scratchDir("missing").string());

        ReconstructionResult result = orchestrator.reconstruct("ghost", nullptr).get();
        ASSERT_THAT(result.state == ReconstructionState::Failed);
        ASSERT_THAT(result.errorKind == ClusterErrorKind::Client);
        ASSERT_THAT(!fileOps.isInFlight("ghost"));
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "Reconstruction Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testSaved),
            TEST(testBlockedNeverDownloads),
            TEST(testCancelled),
            TEST(testConcurrentAttemptRejected),
            TEST(testDownloadFailure),
            TEST(testInfoFailure)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
