#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "StagingArea.hpp"
#include "TransferExecutor.hpp"

// No direct host-to-host path: every file is relayed through a local staging directory
class RemoteToRemoteTransfer : public TransferExecutor
{
public:
    RemoteToRemoteTransfer(const TransferConfig& Config, EventChannel& Channel, RemoteShell& Shell, const RemoteLocation& Destination);

protected:
    void Prepare() override;
    size_t FileCount() const override;
    std::string DisplayName(size_t Index) const override;
    void ProcessFile(size_t Index) override;

private:
    RemoteShell& Shell;
    RemoteLocation Destination;

    std::vector<std::string> RemoteFiles;
    std::vector<std::optional<std::string>> Targets;
    std::unordered_set<std::string> ExistingFiles;
    std::unique_ptr<StagingArea> Staging;

    ProcessResult Download(const std::string& RemoteFile, const std::filesystem::path& Staged);
    ProcessResult Upload(const std::filesystem::path& Staged, const std::string& Target);
    std::string ToolName() const;
};
