#pragma once

#include <pplx/pplxtasks.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <map>
#include <mutex>

#include "cluster_service.hpp"
#include "cluster_error.hpp"
#include "in_flight.hpp"

namespace fs = std::filesystem;

/**
 * Stages of a single reconstruction attempt.
 * 
 * Idle -> FetchingInfo -> InfoReady -> Downloading -> Saved
 * FetchingInfo -> Blocked (not enough shards online)
 * InfoReady -> Cancelled (operator declined)
 * any -> Failed
 */
enum class ReconstructionState
{
    Idle,
    FetchingInfo,
    InfoReady,
    Downloading,
    Saved,
    Blocked,
    Cancelled,
    Failed
};

std::string toString(ReconstructionState state);

/**
 * Outcome of a reconstruction attempt.
 */
struct ReconstructionResult
{
    std::string fileId;
    ReconstructionState state;

    /* feasibility as reported by the service (empty if never fetched) */
    ReconstructionInfo info;

    fs::path savedPath;
    uint64_t savedBytes;

    /* hex SHA-256 of the saved payload */
    std::string sha256;

    std::string message;
    std::optional<ClusterErrorKind> errorKind;

    /* true if another operation on the file was already in flight */
    bool rejected;

    ReconstructionResult();
};

/**
 * Drives a file through info lookup, confirmation, download and save.
 * 
 * NOTE:
 * 
 * One operation per file id may be in flight. `fileOps` is shared with 
 * the delete command, so a file can't be deleted mid-reconstruction.
 */
class ReconstructionOrchestrator
{
public:
    /**
     * Asked to approve a download once the info says the file can be 
     * reconstructed. Returning false cancels the attempt.
     */
    using Confirmation = std::function<bool(const ReconstructionInfo &)>;

    ReconstructionOrchestrator(ClusterService &service, InFlightRegistry &fileOps, std::string downloadDirPath);

    pplx::task<ReconstructionResult> reconstruct(const std::string &fileId, Confirmation confirm);

    /* State of the latest attempt for `fileId`, Idle if there's been none */
    ReconstructionState state(const std::string &fileId) const;

private:
    ClusterService &service;
    InFlightRegistry &fileOps;
    fs::path downloadDirPath;

    mutable std::mutex mutex;
    std::map<std::string, ReconstructionState> states;

    void setState(const std::string &fileId, ReconstructionState state);

    /**
     * Writes `payload` to the download directory under `filename`.
     * 
     * Throws std::runtime_error if the file can't be written.
     */
    fs::path save(const std::string &filename, const std::vector<unsigned char> &payload);
};

namespace ReconstructionTests
{
    void testSaved();
    void testBlockedNeverDownloads();
    void testCancelled();
    void testConcurrentAttemptRejected();
    void testDownloadFailure();
    void testInfoFailure();
    void runAll();
}
