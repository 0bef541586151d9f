#include "commands.hpp"

std::string toString(CommandOutcome outcome)
{
    switch (outcome)
    {
        case CommandOutcome::Applied:        return "applied";
        case CommandOutcome::AlreadyInState: return "already in state";
        case CommandOutcome::Rejected:       return "rejected";
        case CommandOutcome::Stale:          return "stale";
        case CommandOutcome::Failed:         return "failed";
    }
    return "unknown";
}

ToggleResult::ToggleResult()
    : targetState(NodeState::Online),
      outcome(CommandOutcome::Failed)
{
}

ToggleResult::ToggleResult(std::string nodeId, NodeState targetState, CommandOutcome outcome, std::string message)
    : nodeId(std::move(nodeId)),
      targetState(targetState),
      outcome(outcome),
      message(std::move(message)),
      errorKind()
{
}

DeleteResult::DeleteResult()
    : outcome(CommandOutcome::Failed),
      shardsDeleted(0)
{
}

DeleteResult::DeleteResult(std::string fileId, CommandOutcome outcome, std::string message)
    : fileId(std::move(fileId)),
      outcome(outcome),
      message(std::move(message)),
      errorKind(),
      shardsDeleted(0)
{
}
