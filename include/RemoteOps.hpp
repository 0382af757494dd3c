#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "RemoteShell.hpp"

// Composite remote operations, each a single round trip through RemoteShell::Run
namespace RemoteOps
{
    // Throws TransferFatalError when the host cannot be reached
    void Probe(RemoteShell& Shell, const std::string& Host);

    // Every regular file under Root, as absolute remote paths. Throws TransferFatalError on failure.
    std::vector<std::string> ListFiles(RemoteShell& Shell, const std::string& Host, const std::string& Root);

    // Paths of the regular files under Root. A lost connection, or a failed listing with no output,
    // throws TransferFatalError; find's partial output for unreadable subdirectories is accepted.
    std::unordered_set<std::string> ExistingFiles(RemoteShell& Shell, const std::string& Host, const std::string& Root);

    // One "mkdir -p" for the whole set. Throws TransferFatalError on failure.
    void MakeDirectories(RemoteShell& Shell, const std::string& Host, const std::vector<std::string>& Directories);

    bool RemoveFile(RemoteShell& Shell, const std::string& Host, const std::string& Path, std::string& Error);

    // mv -f, replacing To
    bool RenameFile(RemoteShell& Shell, const std::string& Host, const std::string& From, const std::string& To, std::string& Error);

    // Lowercase hex SHA-256, via sha256sum or shasum -a 256. Throws std::runtime_error.
    std::string ComputeSha256(RemoteShell& Shell, const std::string& Host, const std::string& Path);
}
