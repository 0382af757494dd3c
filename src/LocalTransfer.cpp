#include "LocalTransfer.hpp"
#include "DestinationMapper.hpp"
#include "ExclusionRules.hpp"
#include "FileCopier.hpp"
#include "FileScanner.hpp"
#include "IntegrityVerifier.hpp"
#include "PartialFile.hpp"
#include "ProcessRunner.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

LocalTransfer::LocalTransfer(const TransferConfig& Config, EventChannel& Channel)
    : TransferExecutor(Config, Channel), DestinationRoot(Config.Destination)
{
}

void LocalTransfer::Prepare()
{
    if (Config.Source.Kind == SourceKind::Directory)
    {
        std::error_code SourceEc;
        std::error_code DestEc;
        FS::path SourceDir = FS::weakly_canonical(Config.Source.Directory, SourceEc);
        FS::path DestDir = FS::weakly_canonical(DestinationRoot, DestEc);
        if (!SourceEc && !DestEc && SourceDir == DestDir)
        {
            throw TransferFatalError("Source and destination must be different.");
        }
    }

    if (Config.Method == TransferMethod::Rsync && !ProcessRunner::FindInPath("rsync"))
    {
        throw TransferFatalError("rsync is not installed or not in PATH.");
    }

    CreateLocalDestinationRoot(DestinationRoot);

    FileScanner Scanner{ ExclusionRules(Config.Exclusions) };
    Scanner.Scan(Config.Source);
    Files = Scanner.GetFiles();
    Outcome.ExcludedFiles = Scanner.GetExcludedFiles();
    Outcome.ExcludedDirs = Scanner.GetExcludedDirs();
}

size_t LocalTransfer::FileCount() const
{
    return Files.size();
}

std::string LocalTransfer::DisplayName(size_t Index) const
{
    return Files[Index].string();
}

void LocalTransfer::ProcessFile(size_t Index)
{
    const FS::path& Source = Files[Index];
    const std::string Name = Source.string();

    std::optional<std::string> Relative = DestinationMapper::RelativeDestination(Source, Config.Source, Config.Mode);
    if (!Relative)
    {
        RecordSkip(Name, "outside source directory");
        return;
    }
    FS::path Destination = DestinationMapper::ToLocal(DestinationRoot, *Relative, Config.StripSpaces);

    // A file list can name files that already sit in the destination root
    std::error_code SameFileEc;
    if (FS::equivalent(Source, Destination, SameFileEc))
    {
        RecordSkip(Name, "source and destination are the same file");
        return;
    }

    std::error_code Ec;
    FS::create_directories(Destination.parent_path(), Ec);
    if (Ec)
    {
        RecordError(Name, Ec.message());
        return;
    }

    ConflictDecision Decision;
    try
    {
        Decision = Resolver.ResolveLocal(Destination, [&Source, &Destination]() { return IntegrityVerifier::FilesAreIdentical(Source, Destination); });
    }
    catch (const std::exception& Ex)
    {
        RecordError(Name, std::string("could not compare with destination: ") + Ex.what());
        return;
    }

    switch (Decision.Action)
    {
    case ConflictAction::Skip:
        RecordSkip(Name, Decision.SkipReason);
        return;
    case ConflictAction::AlreadyIdentical:
        if (Config.Move)
        {
            DeleteSource(Source);
            RecordCopied(Name);
        }
        else
        {
            RecordSkip(Name, Decision.SkipReason);
        }
        return;
    case ConflictAction::Transfer:
        break;
    }

    if (Config.Move)
    {
        MoveFile(Source, Decision.LocalTarget);
    }
    else
    {
        CopyFile(Source, Decision.LocalTarget);
    }
}

void LocalTransfer::MoveFile(const FS::path& Source, const FS::path& Target)
{
    std::string RenameError;
    if (Config.Method == TransferMethod::Standard && FileCopier::TryRename(Source, Target, RenameError))
    {
        RecordCopied(Source.string());
        return;
    }
    if (!RenameError.empty())
    {
        Log.Info(std::string("[LocalTransfer] Rename not possible, copying instead: ") + RenameError);
    }

    if (CopyAndVerify(Source, Target))
    {
        DeleteSource(Source);
        RecordCopied(Source.string());
    }
}

void LocalTransfer::CopyFile(const FS::path& Source, const FS::path& Target)
{
    if (CopyAndVerify(Source, Target))
    {
        RecordCopied(Source.string());
    }
}

bool LocalTransfer::CopyAndVerify(const FS::path& Source, const FS::path& Target)
{
    PartialFile Partial(Target);

    std::string Error;
    if (!FileCopier::Copy(Source, Partial.GetPath(), Config.Method, Error))
    {
        RecordError(Source.string(), Error);
        return false;
    }

    const std::string Retained = Config.Move ? "original retained" : "copy removed";
    bool Identical = false;
    try
    {
        Identical = IntegrityVerifier::FilesAreIdentical(Source, Partial.GetPath());
    }
    catch (const std::exception& Ex)
    {
        RecordError(Source.string(), std::string("verification error (") + Retained + "): " + Ex.what());
        return false;
    }

    if (!Identical)
    {
        RecordError(Source.string(), "integrity check failed (" + Retained + ")");
        return false;
    }

    if (!Partial.CommitTo(Target, Error))
    {
        RecordError(Source.string(), "verified copy could not be moved into place: " + Error);
        return false;
    }
    return true;
}

void LocalTransfer::DeleteSource(const FS::path& Source)
{
    std::error_code Ec;
    FS::remove(Source, Ec);
    if (Ec)
    {
        RecordWarning(Source.string(), "transferred and verified but failed to delete source: " + Ec.message());
    }
}
