#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "TransferExecutor.hpp"

class RemoteToLocalTransfer : public TransferExecutor
{
public:
    RemoteToLocalTransfer(const TransferConfig& Config, EventChannel& Channel, RemoteShell& Shell);

protected:
    void Prepare() override;
    size_t FileCount() const override;
    std::string DisplayName(size_t Index) const override;
    void ProcessFile(size_t Index) override;

private:
    RemoteShell& Shell;
    std::filesystem::path DestinationRoot;
    std::vector<std::string> RemoteFiles;

    void DeleteRemoteSource(const std::string& RemoteFile);
};
