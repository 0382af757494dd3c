#include "TransferTypes.hpp"

#include <unordered_map>

SourceDescriptor SourceDescriptor::FromDirectory(const std::filesystem::path& Dir)
{
    SourceDescriptor Source;
    Source.Kind = SourceKind::Directory;
    Source.Directory = Dir;
    return Source;
}

SourceDescriptor SourceDescriptor::FromFiles(std::vector<std::filesystem::path> Paths)
{
    SourceDescriptor Source;
    Source.Kind = SourceKind::FileList;
    Source.Files = std::move(Paths);
    return Source;
}

SourceDescriptor SourceDescriptor::FromRemote(const std::string& Host, const std::string& Root)
{
    SourceDescriptor Source;
    Source.Kind = SourceKind::Remote;
    Source.Host = Host;
    Source.RemoteRoot = Root;
    return Source;
}

std::optional<ConflictPolicy> ToConflictPolicy(const std::string& Text)
{
    static const std::unordered_map<std::string, ConflictPolicy> PolicyMap = {
        { "skip",      ConflictPolicy::Skip },
        { "overwrite", ConflictPolicy::Overwrite },
        { "rename",    ConflictPolicy::Rename }
    };

    auto it = PolicyMap.find(Text);
    if (it == PolicyMap.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TransferMode> ToTransferMode(const std::string& Text)
{
    if (Text == "files")
    {
        return TransferMode::FilesOnly;
    }
    if (Text == "folders")
    {
        return TransferMode::FoldersAndFiles;
    }
    return std::nullopt;
}

std::optional<TransferMethod> ToTransferMethod(const std::string& Text)
{
    if (Text == "standard")
    {
        return TransferMethod::Standard;
    }
    if (Text == "rsync")
    {
        return TransferMethod::Rsync;
    }
    return std::nullopt;
}
