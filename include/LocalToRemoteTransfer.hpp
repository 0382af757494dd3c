#pragma once

#include <filesystem>
#include <optional>
#include <unordered_set>
#include <vector>

#include "TransferExecutor.hpp"

class LocalToRemoteTransfer : public TransferExecutor
{
public:
    LocalToRemoteTransfer(const TransferConfig& Config, EventChannel& Channel, RemoteShell& Shell, const RemoteLocation& Destination);

protected:
    void Prepare() override;
    size_t FileCount() const override;
    std::string DisplayName(size_t Index) const override;
    void ProcessFile(size_t Index) override;

private:
    RemoteShell& Shell;
    RemoteLocation Destination;

    std::vector<std::filesystem::path> Files;
    std::vector<std::optional<std::string>> Targets;
    std::unordered_set<std::string> ExistingFiles;
};
