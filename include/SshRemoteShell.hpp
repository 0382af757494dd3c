#pragma once

#include <string>
#include <vector>

#include "RemoteShell.hpp"

class SshRemoteShell : public RemoteShell
{
public:
    SshRemoteShell(const std::string& ControlPath, unsigned short int ControlPersistSeconds);

    ProcessResult Run(const std::string& Host, const std::string& Command) override;

    ProcessResult CopyTo(const std::filesystem::path& Local, const std::string& Host, const std::string& Remote) override;
    ProcessResult CopyFrom(const std::string& Host, const std::string& Remote, const std::filesystem::path& Local) override;

    ProcessResult SyncTo(const std::filesystem::path& Local, const std::string& Host, const std::string& Remote) override;
    ProcessResult SyncFrom(const std::string& Host, const std::string& Remote, const std::filesystem::path& Local) override;

    bool IsToolAvailable(const std::string& Tool) override;

private:
    std::vector<std::string> ControlOptions;

    // "ssh -o ... -o ..." for rsync's -e
    std::string SshCommandLine() const;
    std::vector<std::string> WithControl(const std::string& Program) const;
};
