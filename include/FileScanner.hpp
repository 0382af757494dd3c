#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "ExclusionRules.hpp"
#include "TransferTypes.hpp"

class FileScanner
{
public:
    explicit FileScanner(ExclusionRules Rules);

    void Clear();

    // Directory or FileList sources. Throws TransferFatalError for None, std::logic_error for Remote.
    void Scan(const SourceDescriptor& Source);

    // Applies the exclusion rules to a "find <root> -type f" listing
    void FilterRemoteListing(const std::vector<std::string>& Listing, const std::string& RemoteRoot);

    const std::vector<std::filesystem::path>& GetFiles() const;
    const std::vector<std::string>& GetRemoteFiles() const;
    size_t GetExcludedFiles() const;
    size_t GetExcludedDirs() const;

private:
    ExclusionRules Rules;
    std::vector<std::filesystem::path> Files;
    std::vector<std::string> RemoteFiles;
    size_t ExcludedFiles = 0;
    size_t ExcludedDirs = 0;

    void ScanDirectoryIterative(const std::filesystem::path& Root);
    std::vector<std::filesystem::directory_entry> SortedEntries(const std::filesystem::path& Dir) const;
};
