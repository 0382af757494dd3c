#include "RemoteOps.hpp"
#include "PathUtils.hpp"
#include "TransferTypes.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace
{
    constexpr int SSH_CONNECTION_FAILED = 255;

    std::string DescribeCommandFailure(const std::string& Command, const ProcessResult& Result)
    {
        std::string Error = Command + " exited with code " + std::to_string(Result.ExitCode);
        std::string Detail = ProcessRunner::Trim(Result.StdErr);
        if (!Detail.empty())
        {
            Error += ": " + Detail;
        }
        return Error;
    }
}

namespace RemoteOps
{
    void Probe(RemoteShell& Shell, const std::string& Host)
    {
        ProcessResult Result = Shell.Run(Host, "echo ok");
        if (Result.ExitCode == 127 && Result.StdErr.empty())
        {
            throw TransferFatalError("Could not run ssh command for host '" + Host + "'");
        }
        if (!Result.Succeeded())
        {
            throw TransferFatalError("SSH connection to '" + Host + "' failed: " + ProcessRunner::Trim(Result.StdErr));
        }
        Log.Info(std::string("[RemoteOps] Host reachable: ") + Host);
    }

    std::vector<std::string> ListFiles(RemoteShell& Shell, const std::string& Host, const std::string& Root)
    {
        ProcessResult Result = Shell.Run(Host, "find " + PathUtils::ShellQuote(Root) + " -type f 2>/dev/null");
        if (!Result.Succeeded())
        {
            throw TransferFatalError("Failed to list remote files on '" + Host + "': " + ProcessRunner::Trim(Result.StdErr));
        }

        std::vector<std::string> Files;
        std::stringstream Lines(Result.StdOut);
        std::string Line;
        while (std::getline(Lines, Line))
        {
            Line = ProcessRunner::Trim(Line);
            if (!Line.empty())
            {
                Files.push_back(Line);
            }
        }
        Log.Info(std::string("[RemoteOps] Listed ") + std::to_string(Files.size()) + " files under " + Host + ":" + Root);
        return Files;
    }

    std::unordered_set<std::string> ExistingFiles(RemoteShell& Shell, const std::string& Host, const std::string& Root)
    {
        std::unordered_set<std::string> Existing;
        ProcessResult Result = Shell.Run(Host, "find " + PathUtils::ShellQuote(Root) + " -type f 2>/dev/null");
        if (Result.ExitCode == SSH_CONNECTION_FAILED || (!Result.Succeeded() && Result.StdOut.empty()))
        {
            throw TransferFatalError("Failed to list existing files on '" + Host + "': " + DescribeCommandFailure("find", Result));
        }

        std::stringstream Lines(Result.StdOut);
        std::string Line;
        while (std::getline(Lines, Line))
        {
            if (!Line.empty() && Line.back() == '\r')
            {
                Line.pop_back();
            }
            if (!Line.empty())
            {
                Existing.insert(Line);
            }
        }
        return Existing;
    }

    void MakeDirectories(RemoteShell& Shell, const std::string& Host, const std::vector<std::string>& Directories)
    {
        if (Directories.empty())
        {
            return;
        }

        std::string Command = "mkdir -p";
        for (const auto& Dir : Directories)
        {
            Command += " " + PathUtils::ShellQuote(Dir);
        }

        ProcessResult Result = Shell.Run(Host, Command);
        if (!Result.Succeeded())
        {
            throw TransferFatalError("Failed to create remote directories on '" + Host + "': " + ProcessRunner::Trim(Result.StdErr));
        }
    }

    bool RemoveFile(RemoteShell& Shell, const std::string& Host, const std::string& Path, std::string& Error)
    {
        ProcessResult Result = Shell.Run(Host, "rm -f " + PathUtils::ShellQuote(Path));
        if (!Result.Succeeded())
        {
            Error = DescribeCommandFailure("rm", Result);
            return false;
        }
        return true;
    }

    bool RenameFile(RemoteShell& Shell, const std::string& Host, const std::string& From, const std::string& To, std::string& Error)
    {
        ProcessResult Result = Shell.Run(Host, "mv -f " + PathUtils::ShellQuote(From) + " " + PathUtils::ShellQuote(To));
        if (!Result.Succeeded())
        {
            Error = DescribeCommandFailure("mv", Result);
            return false;
        }
        return true;
    }

    std::string ComputeSha256(RemoteShell& Shell, const std::string& Host, const std::string& Path)
    {
        const std::string Quoted = PathUtils::ShellQuote(Path);
        ProcessResult Result = Shell.Run(Host, "sha256sum " + Quoted + " 2>/dev/null || shasum -a 256 " + Quoted + " 2>/dev/null");
        if (!Result.Succeeded())
        {
            throw std::runtime_error("Remote hash command failed: " + ProcessRunner::Trim(Result.StdErr));
        }

        // "<hash>  <filename>" from either tool
        std::stringstream Output(Result.StdOut);
        std::string Digest;
        if (!(Output >> Digest) || Digest.size() != 64)
        {
            throw std::runtime_error("Could not parse remote hash output");
        }
        std::transform(Digest.begin(), Digest.end(), Digest.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Digest;
    }
}
