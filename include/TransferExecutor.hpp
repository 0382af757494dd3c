#pragma once

#include <optional>
#include <string>
#include <vector>

#include "EventChannel.hpp"
#include "ConflictResolver.hpp"
#include "RemoteShell.hpp"
#include "TransferTypes.hpp"

// One file at a time, in enumeration order. Subclasses supply the topology.
class TransferExecutor
{
public:
    TransferExecutor(const TransferConfig& Config, EventChannel& Channel);
    virtual ~TransferExecutor() = default;

    TransferExecutor(const TransferExecutor&) = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    // Returns false when cancelled. Fatal problems surface as TransferFatalError before any file is touched.
    bool Run();

    const TransferOutcome& GetOutcome() const;

protected:
    virtual void Prepare() = 0;
    virtual size_t FileCount() const = 0;
    virtual std::string DisplayName(size_t Index) const = 0;
    virtual void ProcessFile(size_t Index) = 0;

    bool IsCancelled() const;

    void RecordCopied(const std::string& File);
    void RecordSkip(const std::string& File, const std::string& Reason);
    void RecordError(const std::string& File, const std::string& Reason);
    void RecordWarning(const std::string& File, const std::string& Reason);

    void RequireRemoteTools(RemoteShell& Shell) const;
    void CreateLocalDestinationRoot(const std::filesystem::path& Root) const;

    // Destination root plus every parent directory of the planned targets, sorted and unique
    static std::vector<std::string> RemoteDirectoriesFor(const std::string& Root, const std::vector<std::optional<std::string>>& Targets);

    static std::string DescribeFailure(const std::string& Tool, const ProcessResult& Result);

    // Uploads land on a partial name first; a failed one is removed so the real target stays intact
    static void DiscardRemotePartial(RemoteShell& Shell, const std::string& Host, const std::string& Partial);

    const TransferConfig Config;
    EventChannel& Channel;
    TransferOutcome Outcome;
    ConflictResolver Resolver;
};
