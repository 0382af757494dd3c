#include "TransferExecutor.hpp"
#include "PathUtils.hpp"
#include "RemoteOps.hpp"
#include "Logger.hpp"

#include <set>

namespace FS = std::filesystem;

TransferExecutor::TransferExecutor(const TransferConfig& Config, EventChannel& Channel)
    : Config(Config), Channel(Channel), Resolver(Config.Conflict)
{
}

const TransferOutcome& TransferExecutor::GetOutcome() const
{
    return Outcome;
}

bool TransferExecutor::IsCancelled() const
{
    return Config.CancelFlag && Config.CancelFlag->load();
}

bool TransferExecutor::Run()
{
    Prepare();

    const size_t Total = FileCount();
    Log.Info(std::string("[Transfer] ") + std::to_string(Total) + " files to process");

    for (size_t i = 0; i < Total; ++i)
    {
        if (IsCancelled())
        {
            Log.Warn(std::string("[Transfer] Cancelled with ") + std::to_string(Total - i) + " files not attempted");
            return false;
        }

        try
        {
            ProcessFile(i);
        }
        catch (const std::exception& Ex)
        {
            RecordError(DisplayName(i), Ex.what());
        }

        Channel.Push(TransferEvent::MakeProgress(i + 1, Total, DisplayName(i)));
    }

    Log.Info(std::string("[Transfer] Done: ") + std::to_string(Outcome.Copied) + " copied, " + std::to_string(Outcome.Skipped.size()) + " skipped, " + std::to_string(Outcome.Errors.size()) + " errors");
    return true;
}

void TransferExecutor::RecordCopied(const std::string& File)
{
    ++Outcome.Copied;
    Log.Info(std::string("[Transfer] Transferred: ") + File);
}

void TransferExecutor::RecordSkip(const std::string& File, const std::string& Reason)
{
    Outcome.Skipped.push_back(File + ": " + Reason);
    Log.Info(std::string("[Transfer] Skipped: ") + Outcome.Skipped.back());
}

void TransferExecutor::RecordError(const std::string& File, const std::string& Reason)
{
    Outcome.Errors.push_back(File + ": " + Reason);
    Log.Error(std::string("[Transfer] ") + Outcome.Errors.back());
}

void TransferExecutor::RecordWarning(const std::string& File, const std::string& Reason)
{
    Outcome.Warnings.push_back(File + ": " + Reason);
    Log.Warn(std::string("[Transfer] ") + Outcome.Warnings.back());
}

void TransferExecutor::RequireRemoteTools(RemoteShell& Shell) const
{
    std::vector<std::string> Tools{ "ssh" };
    Tools.push_back(Config.Method == TransferMethod::Rsync ? "rsync" : "scp");

    for (const auto& Tool : Tools)
    {
        if (!Shell.IsToolAvailable(Tool))
        {
            throw TransferFatalError(Tool + " is not installed or not in PATH.");
        }
    }
}

void TransferExecutor::CreateLocalDestinationRoot(const FS::path& Root) const
{
    std::error_code Ec;
    if (FS::is_directory(Root, Ec))
    {
        return;
    }
    FS::create_directories(Root, Ec);
    if (Ec)
    {
        throw TransferFatalError("Failed to create destination directory: " + Ec.message());
    }
}

std::vector<std::string> TransferExecutor::RemoteDirectoriesFor(const std::string& Root, const std::vector<std::optional<std::string>>& Targets)
{
    std::set<std::string> Directories{ PathUtils::TrimTrailingSlashes(Root) };
    for (const auto& Target : Targets)
    {
        if (Target)
        {
            Directories.insert(PathUtils::RemoteParent(*Target));
        }
    }
    return std::vector<std::string>(Directories.begin(), Directories.end());
}

std::string TransferExecutor::DescribeFailure(const std::string& Tool, const ProcessResult& Result)
{
    std::string Description = Tool + " failed (exit code " + std::to_string(Result.ExitCode) + ")";
    std::string Detail = ProcessRunner::Trim(Result.StdErr);
    if (!Detail.empty())
    {
        Description += ": " + Detail;
    }
    return Description;
}

void TransferExecutor::DiscardRemotePartial(RemoteShell& Shell, const std::string& Host, const std::string& Partial)
{
    std::string RemoveError;
    if (!RemoteOps::RemoveFile(Shell, Host, Partial, RemoveError))
    {
        Log.Error(std::string("[Transfer] Could not remove partial copy ") + Host + ":" + Partial + ": " + RemoveError);
    }
}
