#include "RemoteToLocalTransfer.hpp"
#include "DestinationMapper.hpp"
#include "ExclusionRules.hpp"
#include "FileHasher.hpp"
#include "FileScanner.hpp"
#include "IntegrityVerifier.hpp"
#include "PartialFile.hpp"
#include "RemoteOps.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

RemoteToLocalTransfer::RemoteToLocalTransfer(const TransferConfig& Config, EventChannel& Channel, RemoteShell& Shell)
    : TransferExecutor(Config, Channel), Shell(Shell), DestinationRoot(Config.Destination)
{
}

void RemoteToLocalTransfer::Prepare()
{
    const SourceDescriptor& Source = Config.Source;

    RequireRemoteTools(Shell);
    RemoteOps::Probe(Shell, Source.Host);

    FileScanner Scanner{ ExclusionRules(Config.Exclusions) };
    Scanner.FilterRemoteListing(RemoteOps::ListFiles(Shell, Source.Host, Source.RemoteRoot), Source.RemoteRoot);
    RemoteFiles = Scanner.GetRemoteFiles();
    Outcome.ExcludedFiles = Scanner.GetExcludedFiles();
    Outcome.ExcludedDirs = Scanner.GetExcludedDirs();

    CreateLocalDestinationRoot(DestinationRoot);
}

size_t RemoteToLocalTransfer::FileCount() const
{
    return RemoteFiles.size();
}

std::string RemoteToLocalTransfer::DisplayName(size_t Index) const
{
    return RemoteFiles[Index];
}

void RemoteToLocalTransfer::ProcessFile(size_t Index)
{
    const std::string& RemoteFile = RemoteFiles[Index];
    const std::string& Host = Config.Source.Host;

    std::optional<std::string> Relative = DestinationMapper::RelativeDestinationForRemote(RemoteFile, Config.Source.RemoteRoot, Config.Mode);
    if (!Relative)
    {
        RecordSkip(RemoteFile, "outside source directory");
        return;
    }
    FS::path Destination = DestinationMapper::ToLocal(DestinationRoot, *Relative, Config.StripSpaces);

    std::error_code Ec;
    FS::create_directories(Destination.parent_path(), Ec);
    if (Ec)
    {
        RecordError(RemoteFile, Ec.message());
        return;
    }

    ConflictDecision Decision;
    try
    {
        Decision = Resolver.ResolveLocal(Destination, [this, &Destination, &RemoteFile, &Host]() {
            return FileHasher::ContentSha256(Destination) == RemoteOps::ComputeSha256(Shell, Host, RemoteFile);
        });
    }
    catch (const std::exception& Ex)
    {
        RecordError(RemoteFile, std::string("could not compare with destination: ") + Ex.what());
        return;
    }

    switch (Decision.Action)
    {
    case ConflictAction::Skip:
        RecordSkip(RemoteFile, Decision.SkipReason);
        return;
    case ConflictAction::AlreadyIdentical:
        if (Config.Move)
        {
            DeleteRemoteSource(RemoteFile);
            RecordCopied(RemoteFile);
        }
        else
        {
            RecordSkip(RemoteFile, Decision.SkipReason);
        }
        return;
    case ConflictAction::Transfer:
        break;
    }

    const FS::path& Target = Decision.LocalTarget;
    PartialFile Partial(Target);
    ProcessResult Result = (Config.Method == TransferMethod::Rsync)
        ? Shell.SyncFrom(Host, RemoteFile, Partial.GetPath())
        : Shell.CopyFrom(Host, RemoteFile, Partial.GetPath());
    if (!Result.Succeeded())
    {
        RecordError(RemoteFile, "download from source failed, " + DescribeFailure(Config.Method == TransferMethod::Rsync ? "rsync" : "scp", Result));
        return;
    }

    bool Verified = false;
    try
    {
        Verified = IntegrityVerifier::MatchesRemote(Partial.GetPath(), Shell, Host, RemoteFile);
    }
    catch (const std::exception& Ex)
    {
        RecordError(RemoteFile, std::string("downloaded but could not verify: ") + Ex.what() + (Config.Move ? " (original retained)" : ""));
        return;
    }

    if (!Verified)
    {
        RecordError(RemoteFile, "integrity check failed, hash mismatch (original retained, local copy removed)");
        return;
    }

    std::string CommitError;
    if (!Partial.CommitTo(Target, CommitError))
    {
        RecordError(RemoteFile, "verified copy could not be moved into place: " + CommitError);
        return;
    }

    RecordCopied(RemoteFile);
    if (Config.Move)
    {
        DeleteRemoteSource(RemoteFile);
    }
}

void RemoteToLocalTransfer::DeleteRemoteSource(const std::string& RemoteFile)
{
    std::string Error;
    if (!RemoteOps::RemoveFile(Shell, Config.Source.Host, RemoteFile, Error))
    {
        RecordWarning(RemoteFile, "transferred and verified but failed to delete from source: " + Error);
    }
}
