#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class SourceKind
{
    None,
    Directory,
    FileList,
    Remote
};

struct SourceDescriptor
{
    SourceKind Kind = SourceKind::None;
    std::filesystem::path Directory;
    std::vector<std::filesystem::path> Files;
    std::string Host;
    std::string RemoteRoot;

    static SourceDescriptor FromDirectory(const std::filesystem::path& Dir);
    static SourceDescriptor FromFiles(std::vector<std::filesystem::path> Paths);
    static SourceDescriptor FromRemote(const std::string& Host, const std::string& Root);
};

// "host:path" split of a destination or remote source string
struct RemoteLocation
{
    std::string Host;
    std::string Path;
};

enum class TransferMode
{
    FilesOnly,
    FoldersAndFiles
};

enum class ConflictPolicy
{
    Skip,
    Overwrite,
    Rename
};

enum class TransferMethod
{
    Standard,
    Rsync
};

struct TransferOutcome
{
    size_t Copied = 0;
    std::vector<std::string> Skipped;
    size_t ExcludedFiles = 0;
    size_t ExcludedDirs = 0;
    std::vector<std::string> Errors;
    std::vector<std::string> Warnings;
};

struct TransferConfig
{
    SourceDescriptor Source;
    std::string Destination;
    bool Move = false;
    ConflictPolicy Conflict = ConflictPolicy::Skip;
    bool StripSpaces = false;
    TransferMode Mode = TransferMode::FilesOnly;
    TransferMethod Method = TransferMethod::Standard;
    std::vector<std::string> Exclusions;
    std::shared_ptr<std::atomic<bool>> CancelFlag;
};

// Aborts a whole run before (or instead of) per-file processing
class TransferFatalError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

std::optional<ConflictPolicy> ToConflictPolicy(const std::string& Text);
std::optional<TransferMode> ToTransferMode(const std::string& Text);
std::optional<TransferMethod> ToTransferMethod(const std::string& Text);
