#pragma once

#include <filesystem>
#include <string>

// Hidden sibling of a local target that a transfer writes into. The target itself is only
// ever replaced by renaming a verified partial over it; an uncommitted partial is removed.
class PartialFile
{
public:
    explicit PartialFile(const std::filesystem::path& Target);
    ~PartialFile();

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    const std::filesystem::path& GetPath() const;

    // Atomic rename over Target (same directory)
    bool CommitTo(const std::filesystem::path& Target, std::string& Error);

private:
    std::filesystem::path Path;
    bool Committed = false;
};
