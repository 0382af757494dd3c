#pragma once

#include <filesystem>
#include <string>

// Per-run relay directory (unique per instance) for remote-to-remote transfers, removed with everything in it on destruction
class StagingArea
{
public:
    // Throws TransferFatalError if the directory cannot be created
    explicit StagingArea(const std::filesystem::path& Root);
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    std::filesystem::path StagedPathFor(const std::string& Host, const std::string& RemotePath) const;
    const std::filesystem::path& GetDirectory() const;

    // Best effort; a leftover is removed with the directory anyway
    void Discard(const std::filesystem::path& StagedFile) const;

private:
    std::filesystem::path Directory;
};
