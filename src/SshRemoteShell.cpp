#include "SshRemoteShell.hpp"
#include "Logger.hpp"

SshRemoteShell::SshRemoteShell(const std::string& ControlPath, unsigned short int ControlPersistSeconds)
{
    ControlOptions = {
        "-o", "ControlMaster=auto",
        "-o", "ControlPath=" + ControlPath,
        "-o", "ControlPersist=" + std::to_string(ControlPersistSeconds)
    };
}

std::vector<std::string> SshRemoteShell::WithControl(const std::string& Program) const
{
    std::vector<std::string> Args{ Program };
    Args.insert(Args.end(), ControlOptions.begin(), ControlOptions.end());
    return Args;
}

std::string SshRemoteShell::SshCommandLine() const
{
    std::string Line = "ssh";
    for (const auto& Option : ControlOptions)
    {
        Line += " " + Option;
    }
    return Line;
}

ProcessResult SshRemoteShell::Run(const std::string& Host, const std::string& Command)
{
    std::vector<std::string> Args = WithControl("ssh");
    Args.push_back(Host);
    Args.push_back(Command);
    return ProcessRunner::Run(Args);
}

ProcessResult SshRemoteShell::CopyTo(const std::filesystem::path& Local, const std::string& Host, const std::string& Remote)
{
    std::vector<std::string> Args = WithControl("scp");
    Args.push_back("-q");
    Args.push_back(Local.string());
    Args.push_back(Host + ":" + Remote);
    return ProcessRunner::Run(Args);
}

ProcessResult SshRemoteShell::CopyFrom(const std::string& Host, const std::string& Remote, const std::filesystem::path& Local)
{
    std::vector<std::string> Args = WithControl("scp");
    Args.push_back("-q");
    Args.push_back(Host + ":" + Remote);
    Args.push_back(Local.string());
    return ProcessRunner::Run(Args);
}

ProcessResult SshRemoteShell::SyncTo(const std::filesystem::path& Local, const std::string& Host, const std::string& Remote)
{
    return ProcessRunner::Run({ "rsync", "-az", "--checksum", "-e", SshCommandLine(), Local.string(), Host + ":" + Remote });
}

ProcessResult SshRemoteShell::SyncFrom(const std::string& Host, const std::string& Remote, const std::filesystem::path& Local)
{
    return ProcessRunner::Run({ "rsync", "-az", "--checksum", "-e", SshCommandLine(), Host + ":" + Remote, Local.string() });
}

bool SshRemoteShell::IsToolAvailable(const std::string& Tool)
{
    bool Found = ProcessRunner::FindInPath(Tool);
    if (!Found)
    {
        Log.Error(std::string("[SshRemoteShell] Tool not found in PATH: ") + Tool);
    }
    return Found;
}
