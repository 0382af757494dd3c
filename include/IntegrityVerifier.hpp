#pragma once

#include <filesystem>
#include <string>

#include "RemoteShell.hpp"

namespace IntegrityVerifier
{
    // Size check, then chunked byte comparison. Throws std::runtime_error if either side cannot be read.
    bool FilesAreIdentical(const std::filesystem::path& First, const std::filesystem::path& Second);

    // SHA-256 of the local file against the digest computed on Host.
    // Throws std::runtime_error when either digest cannot be produced.
    bool MatchesRemote(const std::filesystem::path& Local, RemoteShell& Shell, const std::string& Host, const std::string& RemotePath);
}
