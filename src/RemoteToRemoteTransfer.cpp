#include "RemoteToRemoteTransfer.hpp"
#include "ConfigGlobal.hpp"
#include "DestinationMapper.hpp"
#include "ExclusionRules.hpp"
#include "FileScanner.hpp"
#include "IntegrityVerifier.hpp"
#include "PathUtils.hpp"
#include "RemoteOps.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    // Staged copy is dropped on every exit path of a file
    class StagedFileGuard
    {
    public:
        StagedFileGuard(const StagingArea& Area, FS::path File) : Area(Area), File(std::move(File)) {}
        ~StagedFileGuard() { Area.Discard(File); }

        StagedFileGuard(const StagedFileGuard&) = delete;
        StagedFileGuard& operator=(const StagedFileGuard&) = delete;

    private:
        const StagingArea& Area;
        FS::path File;
    };
}

RemoteToRemoteTransfer::RemoteToRemoteTransfer(const TransferConfig& Config, EventChannel& Channel, RemoteShell& Shell, const RemoteLocation& Destination)
    : TransferExecutor(Config, Channel), Shell(Shell), Destination(Destination)
{
}

std::string RemoteToRemoteTransfer::ToolName() const
{
    return Config.Method == TransferMethod::Rsync ? "rsync" : "scp";
}

void RemoteToRemoteTransfer::Prepare()
{
    const SourceDescriptor& Source = Config.Source;

    RequireRemoteTools(Shell);
    RemoteOps::Probe(Shell, Source.Host);
    if (Destination.Host != Source.Host)
    {
        RemoteOps::Probe(Shell, Destination.Host);
    }

    FileScanner Scanner{ ExclusionRules(Config.Exclusions) };
    Scanner.FilterRemoteListing(RemoteOps::ListFiles(Shell, Source.Host, Source.RemoteRoot), Source.RemoteRoot);
    RemoteFiles = Scanner.GetRemoteFiles();
    Outcome.ExcludedFiles = Scanner.GetExcludedFiles();
    Outcome.ExcludedDirs = Scanner.GetExcludedDirs();

    Targets.reserve(RemoteFiles.size());
    for (const auto& RemoteFile : RemoteFiles)
    {
        std::optional<std::string> Relative = DestinationMapper::RelativeDestinationForRemote(RemoteFile, Source.RemoteRoot, Config.Mode);
        if (Relative)
        {
            Targets.push_back(DestinationMapper::ToRemote(Destination.Path, *Relative, Config.StripSpaces));
        }
        else
        {
            Targets.push_back(std::nullopt);
        }
    }

    if (RemoteFiles.empty())
    {
        return;
    }

    RemoteOps::MakeDirectories(Shell, Destination.Host, RemoteDirectoriesFor(Destination.Path, Targets));
    if (Resolver.NeedsRemoteListing())
    {
        ExistingFiles = RemoteOps::ExistingFiles(Shell, Destination.Host, Destination.Path);
    }

    Staging = std::make_unique<StagingArea>(ConfigGlobal::StagingRoot);
}

size_t RemoteToRemoteTransfer::FileCount() const
{
    return RemoteFiles.size();
}

std::string RemoteToRemoteTransfer::DisplayName(size_t Index) const
{
    return RemoteFiles[Index];
}

ProcessResult RemoteToRemoteTransfer::Download(const std::string& RemoteFile, const FS::path& Staged)
{
    if (Config.Method == TransferMethod::Rsync)
    {
        return Shell.SyncFrom(Config.Source.Host, RemoteFile, Staged);
    }
    return Shell.CopyFrom(Config.Source.Host, RemoteFile, Staged);
}

ProcessResult RemoteToRemoteTransfer::Upload(const FS::path& Staged, const std::string& Target)
{
    if (Config.Method == TransferMethod::Rsync)
    {
        return Shell.SyncTo(Staged, Destination.Host, Target);
    }
    return Shell.CopyTo(Staged, Destination.Host, Target);
}

void RemoteToRemoteTransfer::ProcessFile(size_t Index)
{
    const std::string& RemoteFile = RemoteFiles[Index];
    const std::string& SourceHost = Config.Source.Host;

    if (!Targets[Index])
    {
        RecordSkip(RemoteFile, "outside source directory");
        return;
    }

    if (Destination.Host == SourceHost && PathUtils::SameRemotePath(*Targets[Index], RemoteFile))
    {
        RecordSkip(RemoteFile, "source and destination are the same file");
        return;
    }

    ConflictDecision Decision = Resolver.ResolveRemote(*Targets[Index], ExistingFiles);
    if (Decision.Action == ConflictAction::Skip)
    {
        RecordSkip(RemoteFile, Decision.SkipReason);
        return;
    }
    const std::string& Target = Decision.RemoteTarget;

    const FS::path Staged = Staging->StagedPathFor(SourceHost, RemoteFile);
    StagedFileGuard Guard(*Staging, Staged);

    ProcessResult Result = Download(RemoteFile, Staged);
    if (!Result.Succeeded())
    {
        RecordError(RemoteFile, "download from source failed, " + DescribeFailure(ToolName(), Result));
        return;
    }

    try
    {
        if (!IntegrityVerifier::MatchesRemote(Staged, Shell, SourceHost, RemoteFile))
        {
            RecordError(RemoteFile, "download integrity check failed, hash mismatch");
            return;
        }
    }
    catch (const std::exception& Ex)
    {
        RecordError(RemoteFile, std::string("download verification error: ") + Ex.what());
        return;
    }

    const std::string Partial = PathUtils::RemotePartialPath(Target);
    Result = Upload(Staged, Partial);
    if (!Result.Succeeded())
    {
        DiscardRemotePartial(Shell, Destination.Host, Partial);
        RecordError(RemoteFile, "upload to destination failed, " + DescribeFailure(ToolName(), Result));
        return;
    }

    bool Verified = false;
    try
    {
        Verified = IntegrityVerifier::MatchesRemote(Staged, Shell, Destination.Host, Partial);
    }
    catch (const std::exception& Ex)
    {
        DiscardRemotePartial(Shell, Destination.Host, Partial);
        RecordError(RemoteFile, std::string("upload verification error: ") + Ex.what());
        return;
    }

    if (!Verified)
    {
        DiscardRemotePartial(Shell, Destination.Host, Partial);
        RecordError(RemoteFile, "upload integrity check failed, hash mismatch (source retained, destination copy removed)");
        return;
    }

    std::string RenameError;
    if (!RemoteOps::RenameFile(Shell, Destination.Host, Partial, Target, RenameError))
    {
        DiscardRemotePartial(Shell, Destination.Host, Partial);
        RecordError(RemoteFile, "verified copy could not be moved into place: " + RenameError);
        return;
    }

    RecordCopied(RemoteFile);
    if (Config.Move)
    {
        std::string RemoveError;
        if (!RemoteOps::RemoveFile(Shell, SourceHost, RemoteFile, RemoveError))
        {
            RecordWarning(RemoteFile, "transferred and verified but failed to delete from source: " + RemoveError);
        }
    }
}
