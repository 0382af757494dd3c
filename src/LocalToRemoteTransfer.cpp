#include "LocalToRemoteTransfer.hpp"
#include "DestinationMapper.hpp"
#include "ExclusionRules.hpp"
#include "FileScanner.hpp"
#include "IntegrityVerifier.hpp"
#include "PathUtils.hpp"
#include "RemoteOps.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

LocalToRemoteTransfer::LocalToRemoteTransfer(const TransferConfig& Config, EventChannel& Channel, RemoteShell& Shell, const RemoteLocation& Destination)
    : TransferExecutor(Config, Channel), Shell(Shell), Destination(Destination)
{
}

void LocalToRemoteTransfer::Prepare()
{
    RequireRemoteTools(Shell);
    RemoteOps::Probe(Shell, Destination.Host);

    FileScanner Scanner{ ExclusionRules(Config.Exclusions) };
    Scanner.Scan(Config.Source);
    Files = Scanner.GetFiles();
    Outcome.ExcludedFiles = Scanner.GetExcludedFiles();
    Outcome.ExcludedDirs = Scanner.GetExcludedDirs();

    Targets.reserve(Files.size());
    for (const auto& File : Files)
    {
        std::optional<std::string> Relative = DestinationMapper::RelativeDestination(File, Config.Source, Config.Mode);
        if (Relative)
        {
            Targets.push_back(DestinationMapper::ToRemote(Destination.Path, *Relative, Config.StripSpaces));
        }
        else
        {
            Targets.push_back(std::nullopt);
        }
    }

    if (Files.empty())
    {
        return;
    }

    RemoteOps::MakeDirectories(Shell, Destination.Host, RemoteDirectoriesFor(Destination.Path, Targets));
    if (Resolver.NeedsRemoteListing())
    {
        ExistingFiles = RemoteOps::ExistingFiles(Shell, Destination.Host, Destination.Path);
    }
}

size_t LocalToRemoteTransfer::FileCount() const
{
    return Files.size();
}

std::string LocalToRemoteTransfer::DisplayName(size_t Index) const
{
    return Files[Index].string();
}

void LocalToRemoteTransfer::ProcessFile(size_t Index)
{
    const FS::path& Source = Files[Index];
    const std::string Name = Source.string();

    if (!Targets[Index])
    {
        RecordSkip(Name, "outside source directory");
        return;
    }

    ConflictDecision Decision = Resolver.ResolveRemote(*Targets[Index], ExistingFiles);
    if (Decision.Action == ConflictAction::Skip)
    {
        RecordSkip(Name, Decision.SkipReason);
        return;
    }
    const std::string& Target = Decision.RemoteTarget;
    const std::string Partial = PathUtils::RemotePartialPath(Target);

    ProcessResult Result = (Config.Method == TransferMethod::Rsync)
        ? Shell.SyncTo(Source, Destination.Host, Partial)
        : Shell.CopyTo(Source, Destination.Host, Partial);
    if (!Result.Succeeded())
    {
        DiscardRemotePartial(Shell, Destination.Host, Partial);
        RecordError(Name, DescribeFailure(Config.Method == TransferMethod::Rsync ? "rsync" : "scp", Result));
        return;
    }

    bool Verified = false;
    try
    {
        Verified = IntegrityVerifier::MatchesRemote(Source, Shell, Destination.Host, Partial);
    }
    catch (const std::exception& Ex)
    {
        DiscardRemotePartial(Shell, Destination.Host, Partial);
        RecordError(Name, std::string("transferred but could not verify: ") + Ex.what() + (Config.Move ? " (original retained)" : ""));
        return;
    }

    if (!Verified)
    {
        DiscardRemotePartial(Shell, Destination.Host, Partial);
        RecordError(Name, "integrity check failed, hash mismatch (original retained, remote copy removed)");
        return;
    }

    std::string RenameError;
    if (!RemoteOps::RenameFile(Shell, Destination.Host, Partial, Target, RenameError))
    {
        DiscardRemotePartial(Shell, Destination.Host, Partial);
        RecordError(Name, "verified copy could not be moved into place: " + RenameError);
        return;
    }

    RecordCopied(Name);
    if (Config.Move)
    {
        std::error_code Ec;
        FS::remove(Source, Ec);
        if (Ec)
        {
            RecordWarning(Name, "transferred and verified but failed to delete local: " + Ec.message());
        }
    }
}
