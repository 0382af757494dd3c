#include "ConflictResolver.hpp"
#include "PathUtils.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

ConflictResolver::ConflictResolver(ConflictPolicy Policy)
    : Policy(Policy)
{
}

bool ConflictResolver::NeedsRemoteListing() const
{
    return Policy != ConflictPolicy::Overwrite;
}

ConflictDecision ConflictResolver::ResolveLocal(const FS::path& Destination, const std::function<bool()>& IdenticalCheck) const
{
    ConflictDecision Decision;
    Decision.LocalTarget = Destination;

    std::error_code Ec;
    if (!FS::exists(Destination, Ec))
    {
        return Decision;
    }

    if (IdenticalCheck && IdenticalCheck())
    {
        Decision.Action = ConflictAction::AlreadyIdentical;
        Decision.SkipReason = "identical at destination";
        return Decision;
    }

    switch (Policy)
    {
    case ConflictPolicy::Skip:
        Decision.Action = ConflictAction::Skip;
        Decision.SkipReason = "different version exists at destination";
        break;
    case ConflictPolicy::Overwrite:
        Log.Info(std::string("[Conflict] Overwriting: ") + Destination.string());
        break;
    case ConflictPolicy::Rename:
        Decision.LocalTarget = UniqueLocalPath(Destination);
        Log.Info(std::string("[Conflict] Renamed: ") + Destination.string() + " -> " + Decision.LocalTarget.string());
        break;
    }
    return Decision;
}

ConflictDecision ConflictResolver::ResolveRemote(const std::string& Destination, std::unordered_set<std::string>& Existing) const
{
    ConflictDecision Decision;
    Decision.RemoteTarget = Destination;

    if (Policy == ConflictPolicy::Overwrite || Existing.count(Destination) == 0)
    {
        if (Policy != ConflictPolicy::Overwrite)
        {
            Existing.insert(Destination);
        }
        return Decision;
    }

    if (Policy == ConflictPolicy::Skip)
    {
        Decision.Action = ConflictAction::Skip;
        Decision.SkipReason = "already exists at destination";
        return Decision;
    }

    Decision.RemoteTarget = UniqueRemotePath(Destination, Existing);
    Existing.insert(Decision.RemoteTarget);
    Log.Info(std::string("[Conflict] Renamed: ") + Destination + " -> " + Decision.RemoteTarget);
    return Decision;
}

FS::path ConflictResolver::UniqueLocalPath(const FS::path& Destination)
{
    const FS::path Parent = Destination.parent_path();
    const std::string FileName = Destination.filename().string();

    std::error_code Ec;
    for (unsigned int N = 1;; ++N)
    {
        FS::path Candidate = Parent / PathUtils::NumberedName(FileName, N);
        if (!FS::exists(Candidate, Ec))
        {
            return Candidate;
        }
    }
}

std::string ConflictResolver::UniqueRemotePath(const std::string& Destination, const std::unordered_set<std::string>& Existing)
{
    const std::string Parent = PathUtils::RemoteParent(Destination);
    const std::string FileName = PathUtils::RemoteFileName(Destination);

    for (unsigned int N = 1;; ++N)
    {
        std::string Candidate = PathUtils::JoinRemote(Parent, PathUtils::NumberedName(FileName, N));
        if (Existing.count(Candidate) == 0)
        {
            return Candidate;
        }
    }
}
