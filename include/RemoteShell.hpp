#pragma once

#include <filesystem>
#include <string>

#include "ProcessRunner.hpp"

// Everything the engine needs from a remote host. Data movement is delegated
// to external copy/sync tools; the engine only ever issues commands through here.
class RemoteShell
{
public:
    virtual ~RemoteShell() = default;

    virtual ProcessResult Run(const std::string& Host, const std::string& Command) = 0;

    virtual ProcessResult CopyTo(const std::filesystem::path& Local, const std::string& Host, const std::string& Remote) = 0;
    virtual ProcessResult CopyFrom(const std::string& Host, const std::string& Remote, const std::filesystem::path& Local) = 0;

    // Checksum-verified sync of a single file
    virtual ProcessResult SyncTo(const std::filesystem::path& Local, const std::string& Host, const std::string& Remote) = 0;
    virtual ProcessResult SyncFrom(const std::string& Host, const std::string& Remote, const std::filesystem::path& Local) = 0;

    virtual bool IsToolAvailable(const std::string& Tool) = 0;
};
