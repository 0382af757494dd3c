#pragma once

#include <string>

#include "TransferTypes.hpp"

enum class EventKind
{
    Progress,
    Finished,
    Cancelled,
    FatalError
};

struct TransferEvent
{
    EventKind Kind = EventKind::Progress;

    // Progress
    size_t Done = 0;
    size_t Total = 0;
    std::string CurrentFile;

    // Finished, Cancelled
    TransferOutcome Outcome;

    // FatalError
    std::string Message;

    bool IsTerminal() const { return Kind != EventKind::Progress; }

    static TransferEvent MakeProgress(size_t Done, size_t Total, const std::string& CurrentFile);
    static TransferEvent MakeFinished(const TransferOutcome& Outcome);
    static TransferEvent MakeCancelled(const TransferOutcome& Outcome);
    static TransferEvent MakeFatalError(const std::string& Message);
};
