#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <unordered_set>

#include "TransferTypes.hpp"

enum class ConflictAction
{
    Transfer,
    AlreadyIdentical,
    Skip
};

struct ConflictDecision
{
    ConflictAction Action = ConflictAction::Transfer;
    std::filesystem::path LocalTarget;
    std::string RemoteTarget;
    std::string SkipReason;
};

class ConflictResolver
{
public:
    explicit ConflictResolver(ConflictPolicy Policy);

    // IdenticalCheck runs only when the destination exists; it may throw on I/O failure.
    ConflictDecision ResolveLocal(const std::filesystem::path& Destination, const std::function<bool()>& IdenticalCheck) const;

    // Existing is the destination listing fetched once per run. Rename records its choice in it.
    ConflictDecision ResolveRemote(const std::string& Destination, std::unordered_set<std::string>& Existing) const;

    static std::filesystem::path UniqueLocalPath(const std::filesystem::path& Destination);
    static std::string UniqueRemotePath(const std::string& Destination, const std::unordered_set<std::string>& Existing);

    bool NeedsRemoteListing() const;

private:
    ConflictPolicy Policy;
};
