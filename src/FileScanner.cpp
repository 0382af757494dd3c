#include <filesystem>
#include <algorithm>
#include <set>
#include <sstream>
#include <stack>
#include <stdexcept>

#include "FileScanner.hpp"
#include "PathUtils.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

FileScanner::FileScanner(ExclusionRules Rules)
    : Rules(std::move(Rules))
{
}

const std::vector<FS::path>& FileScanner::GetFiles() const
{
    return Files;
}

const std::vector<std::string>& FileScanner::GetRemoteFiles() const
{
    return RemoteFiles;
}

size_t FileScanner::GetExcludedFiles() const
{
    return ExcludedFiles;
}

size_t FileScanner::GetExcludedDirs() const
{
    return ExcludedDirs;
}

void FileScanner::Clear()
{
    Files.clear();
    RemoteFiles.clear();
    ExcludedFiles = 0;
    ExcludedDirs = 0;
}

void FileScanner::Scan(const SourceDescriptor& Source)
{
    switch (Source.Kind)
    {
    case SourceKind::None:
        throw TransferFatalError("No source selected.");
    case SourceKind::Remote:
        throw std::logic_error("Remote source uses its own file listing.");
    case SourceKind::FileList:
        // Explicitly chosen files bypass every exclusion rule
        Files.insert(Files.end(), Source.Files.begin(), Source.Files.end());
        Log.Info(std::string("[Scanner] File list with ") + std::to_string(Source.Files.size()) + " entries");
        return;
    case SourceKind::Directory:
        break;
    }

    std::error_code Ec;
    if (!FS::is_directory(Source.Directory, Ec))
    {
        throw TransferFatalError("Source directory does not exist: " + Source.Directory.string());
    }
    ScanDirectoryIterative(Source.Directory);
    Log.Info(std::string("[Scanner] ") + Source.Directory.string() + ": " + std::to_string(Files.size()) + " files, " + std::to_string(ExcludedFiles) + " excluded files, " + std::to_string(ExcludedDirs) + " excluded directories");
}

std::vector<FS::directory_entry> FileScanner::SortedEntries(const FS::path& Dir) const
{
    std::vector<FS::directory_entry> Entries;
    try
    {
        for (const auto& Entry : FS::directory_iterator(Dir))
        {
            Entries.push_back(Entry);
        }
    }
    catch (const FS::filesystem_error& e)
    {
        Log.Error(std::string("[Scanner] Filesystem error iterating directory: ") + e.what() + std::string(" Path: ") + Dir.string());
    }
    std::sort(Entries.begin(), Entries.end(), [](const FS::directory_entry& A, const FS::directory_entry& B) { return A.path().filename() < B.path().filename(); });
    return Entries;
}

// Depth-first pre-order. Children are pushed in reverse so they pop in name order.
void FileScanner::ScanDirectoryIterative(const FS::path& Root)
{
    std::stack<FS::directory_entry> EntryStack;
    std::vector<FS::directory_entry> RootEntries = SortedEntries(Root);
    for (auto It = RootEntries.rbegin(); It != RootEntries.rend(); ++It)
    {
        EntryStack.push(*It);
    }

    while (!EntryStack.empty())
    {
        FS::directory_entry Entry = EntryStack.top();
        EntryStack.pop();

        try
        {
            const std::string Name = Entry.path().filename().string();

            // Symlinks are never followed or copied
            if (Entry.is_symlink())
            {
                Log.Info(std::string("[Scanner] Skipping SymLink: ") + Entry.path().string());
                continue;
            }
            if (Entry.is_directory())
            {
                if (Rules.IsExcludedDirectory(Name))
                {
                    ++ExcludedDirs;
                    Log.Info(std::string("[Scanner] Skipping Excluded Directory: ") + Entry.path().string());
                    continue;
                }
                std::vector<FS::directory_entry> Children = SortedEntries(Entry.path());
                for (auto It = Children.rbegin(); It != Children.rend(); ++It)
                {
                    EntryStack.push(*It);
                }
            }
            else if (Entry.is_regular_file())
            {
                if (Rules.IsExcludedFile(Name))
                {
                    ++ExcludedFiles;
                    Log.Info(std::string("[Scanner] Skipping Excluded File: ") + Entry.path().string());
                    continue;
                }
                Files.push_back(Entry.path());
            }
        }
        catch (const FS::filesystem_error& e)
        {
            Log.Error(std::string("[Scanner] Filesystem error accessing entry: ") + e.what() + std::string(" Path: ") + Entry.path().string());
        }
    }
}

// Each excluded directory is counted once, at its shallowest excluded level,
// so the count agrees with what a local traversal would have pruned.
void FileScanner::FilterRemoteListing(const std::vector<std::string>& Listing, const std::string& RemoteRoot)
{
    const std::string Root = PathUtils::TrimTrailingSlashes(RemoteRoot);
    const std::string Prefix = (Root == "/") ? Root : Root + "/";
    std::set<std::string> PrunedDirectories;

    for (const auto& FilePath : Listing)
    {
        if (!FilePath.starts_with(Prefix))
        {
            Log.Warn(std::string("[Scanner] Remote entry outside root ignored: ") + FilePath);
            continue;
        }

        std::vector<std::string> Components;
        std::stringstream Rest(FilePath.substr(Prefix.size()));
        std::string Segment;
        while (std::getline(Rest, Segment, '/'))
        {
            if (!Segment.empty())
            {
                Components.push_back(Segment);
            }
        }
        if (Components.empty())
        {
            continue;
        }

        bool Pruned = false;
        std::string DirectoryPath = Root;
        for (size_t i = 0; i + 1 < Components.size(); ++i)
        {
            DirectoryPath = PathUtils::JoinRemote(DirectoryPath, Components[i]);
            if (Rules.IsExcludedDirectory(Components[i]))
            {
                if (PrunedDirectories.insert(DirectoryPath).second)
                {
                    Log.Info(std::string("[Scanner] Skipping Excluded Remote Directory: ") + DirectoryPath);
                }
                Pruned = true;
                break;
            }
        }
        if (Pruned)
        {
            continue;
        }

        if (Rules.IsExcludedFile(Components.back()))
        {
            ++ExcludedFiles;
            Log.Info(std::string("[Scanner] Skipping Excluded Remote File: ") + FilePath);
            continue;
        }
        RemoteFiles.push_back(FilePath);
    }

    ExcludedDirs += PrunedDirectories.size();
    Log.Info(std::string("[Scanner] Remote listing under ") + Root + ": " + std::to_string(RemoteFiles.size()) + " files, " + std::to_string(ExcludedFiles) + " excluded files, " + std::to_string(ExcludedDirs) + " excluded directories");
}
