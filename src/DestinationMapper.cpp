#include "DestinationMapper.hpp"
#include "PathUtils.hpp"

namespace FS = std::filesystem;

namespace
{
    // "/data/photos/" -> "/data/photos"
    FS::path WithoutTrailingSeparator(const FS::path& Root)
    {
        FS::path Normal = Root.lexically_normal();
        if (!Normal.has_filename() && Normal != Normal.root_path())
        {
            Normal = Normal.parent_path();
        }
        return Normal;
    }
}

namespace DestinationMapper
{
    std::optional<std::string> RelativeDestination(const FS::path& SourceFile, const SourceDescriptor& Source, TransferMode Mode)
    {
        if (Mode == TransferMode::FilesOnly || Source.Kind != SourceKind::Directory)
        {
            return SourceFile.filename().string();
        }

        const FS::path Root = WithoutTrailingSeparator(FS::absolute(Source.Directory));
        FS::path Relative = FS::absolute(SourceFile).lexically_normal().lexically_relative(Root);
        if (Relative.empty() || Relative == "." || *Relative.begin() == "..")
        {
            return std::nullopt;
        }

        std::string BaseName = Root.filename().string();
        if (BaseName.empty())
        {
            return Relative.generic_string();
        }
        return BaseName + "/" + Relative.generic_string();
    }

    std::optional<std::string> RelativeDestinationForRemote(const std::string& RemoteFile, const std::string& RemoteRoot, TransferMode Mode)
    {
        if (Mode == TransferMode::FilesOnly)
        {
            return PathUtils::RemoteFileName(RemoteFile);
        }

        const std::string Root = PathUtils::TrimTrailingSlashes(RemoteRoot);
        const std::string Prefix = (Root == "/") ? Root : Root + "/";
        if (!RemoteFile.starts_with(Prefix) || RemoteFile.size() == Prefix.size())
        {
            return std::nullopt;
        }

        std::string Relative = RemoteFile.substr(Prefix.size());
        std::string BaseName = PathUtils::RemoteFileName(Root);
        if (BaseName.empty() || BaseName == "/")
        {
            return Relative;
        }
        return BaseName + "/" + Relative;
    }

    FS::path ToLocal(const FS::path& DestRoot, const std::string& Relative, bool StripSpaces)
    {
        if (StripSpaces)
        {
            return DestRoot / FS::path(PathUtils::RemoveSpacesFromComponents(Relative));
        }
        return DestRoot / FS::path(Relative);
    }

    std::string ToRemote(const std::string& DestRoot, const std::string& Relative, bool StripSpaces)
    {
        if (StripSpaces)
        {
            return PathUtils::JoinRemote(DestRoot, PathUtils::RemoveSpacesFromComponents(Relative));
        }
        return PathUtils::JoinRemote(DestRoot, Relative);
    }
}
