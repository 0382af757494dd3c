#pragma once

#include <filesystem>
#include <vector>

#include "TransferExecutor.hpp"

class LocalTransfer : public TransferExecutor
{
public:
    LocalTransfer(const TransferConfig& Config, EventChannel& Channel);

protected:
    void Prepare() override;
    size_t FileCount() const override;
    std::string DisplayName(size_t Index) const override;
    void ProcessFile(size_t Index) override;

private:
    std::filesystem::path DestinationRoot;
    std::vector<std::filesystem::path> Files;

    void MoveFile(const std::filesystem::path& Source, const std::filesystem::path& Target);
    void CopyFile(const std::filesystem::path& Source, const std::filesystem::path& Target);

    // Copies into a partial beside Target and byte-compares; only a verified copy replaces Target
    bool CopyAndVerify(const std::filesystem::path& Source, const std::filesystem::path& Target);
    void DeleteSource(const std::filesystem::path& Source);
};
