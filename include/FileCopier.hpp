#pragma once

#include <filesystem>
#include <string>

#include "TransferTypes.hpp"

class FileCopier
{
public:
    static bool CopyFileRangeSupported;
    static void CheckCopyFileRangeSupport();

    // Content and permission bits; Destination is created or truncated
    static bool CopyLocalFile(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Error);

    // rsync -a --checksum of a single file
    static bool SyncLocalFile(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Error);

    static bool Copy(const std::filesystem::path& Source, const std::filesystem::path& Destination, TransferMethod Method, std::string& Error);

    // Atomic rename; false when it fails, for instance across devices
    static bool TryRename(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Error);

private:
    static bool CopyWithReadWrite(int SrcFd, int DestFd, std::string& Error);
};
