#pragma once

#include <string>
#include <vector>
#include <optional>

#include "storage_node.hpp"
#include "cluster_error.hpp"

/**
 * Outcome of an operator command.
 */
enum class CommandOutcome
{
    /* the service committed the change */
    Applied,

    /* entity was already in the requested state - benign */
    AlreadyInState,

    /* another command for the same entity is in flight */
    Rejected,

    /* the entity left the snapshot while the command was in flight */
    Stale,

    /* the service call failed - see `errorKind` */
    Failed
};

std::string toString(CommandOutcome outcome);

/**
 * Result of a simulate-failure / restore command.
 */
struct ToggleResult
{
    std::string nodeId;
    NodeState targetState;
    CommandOutcome outcome;

    /* service message, or the reason for Rejected / Stale / Failed */
    std::string message;

    /* set iff outcome is Failed */
    std::optional<ClusterErrorKind> errorKind;

    ToggleResult();
    ToggleResult(std::string nodeId, NodeState targetState, CommandOutcome outcome, std::string message = "");

    bool succeeded() const 
    { 
        return outcome == CommandOutcome::Applied || outcome == CommandOutcome::AlreadyInState; 
    }
};

/**
 * Result of a delete command.
 */
struct DeleteResult
{
    std::string fileId;
    CommandOutcome outcome;
    std::string message;
    std::optional<ClusterErrorKind> errorKind;

    uint32_t shardsDeleted;

    /* per-shard deletion errors reported by the service */
    std::vector<std::string> shardErrors;

    DeleteResult();
    DeleteResult(std::string fileId, CommandOutcome outcome, std::string message = "");
};
