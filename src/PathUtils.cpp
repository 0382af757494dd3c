#include "PathUtils.hpp"

#include <algorithm>
#include <sstream>

namespace FS = std::filesystem;

namespace PathUtils
{
    std::optional<RemoteLocation> ParseLocation(const std::string& Text)
    {
        size_t ColonPos = Text.find(':');
        if (ColonPos == std::string::npos)
        {
            return std::nullopt;
        }

        std::string Host = Text.substr(0, ColonPos);
        std::string Path = Text.substr(ColonPos + 1);

        if (Host.empty() || Host.find('/') != std::string::npos || Path.empty())
        {
            return std::nullopt;
        }
        return RemoteLocation{ Host, Path };
    }

    std::string ShellQuote(const std::string& Text)
    {
        std::string Quoted = "'";
        for (char Ch : Text)
        {
            if (Ch == '\'')
            {
                Quoted += "'\\''";
            }
            else
            {
                Quoted += Ch;
            }
        }
        Quoted += "'";
        return Quoted;
    }

    std::string TrimTrailingSlashes(const std::string& RemotePath)
    {
        std::string Trimmed(RemotePath);
        while (Trimmed.size() > 1 && Trimmed.back() == '/')
        {
            Trimmed.pop_back();
        }
        return Trimmed;
    }

    std::string JoinRemote(const std::string& Base, const std::string& Relative)
    {
        std::string Left = TrimTrailingSlashes(Base);
        if (Left == "/")
        {
            return "/" + Relative;
        }
        return Left + "/" + Relative;
    }

    std::string RemoteParent(const std::string& RemotePath)
    {
        size_t SlashPos = RemotePath.find_last_of('/');
        if (SlashPos == std::string::npos)
        {
            return ".";
        }
        if (SlashPos == 0)
        {
            return "/";
        }
        return RemotePath.substr(0, SlashPos);
    }

    std::string RemoteFileName(const std::string& RemotePath)
    {
        std::string Trimmed = TrimTrailingSlashes(RemotePath);
        size_t SlashPos = Trimmed.find_last_of('/');
        if (SlashPos == std::string::npos)
        {
            return Trimmed;
        }
        return Trimmed.substr(SlashPos + 1);
    }

    std::string RemoveSpaces(const std::string& Component)
    {
        std::string Cleaned(Component);
        Cleaned.erase(std::remove(Cleaned.begin(), Cleaned.end(), ' '), Cleaned.end());
        return Cleaned;
    }

    std::string RemoveSpacesFromComponents(const std::string& RelativePath)
    {
        std::string Cleaned;
        std::stringstream Rest(RelativePath);
        std::string Segment;
        bool First = true;
        while (std::getline(Rest, Segment, '/'))
        {
            if (!First)
            {
                Cleaned += "/";
            }
            Cleaned += RemoveSpaces(Segment);
            First = false;
        }
        return Cleaned;
    }

    std::string NumberedName(const std::string& FileName, unsigned int Number)
    {
        FS::path Name(FileName);
        std::string Stem = Name.stem().string();
        std::string Extension = Name.extension().string();
        return Stem + " (" + std::to_string(Number) + ")" + Extension;
    }

    std::string ShortenFileName(const std::string& FileName, size_t MaxBytes)
    {
        if (FileName.size() <= MaxBytes)
        {
            return FileName;
        }

        std::string Extension = FS::path(FileName).extension().string();
        if (Extension.size() * 2 > MaxBytes)
        {
            Extension.clear();
        }
        return FileName.substr(0, MaxBytes - Extension.size()) + Extension;
    }

    std::string PartialFileName(const std::string& FileName)
    {
        const std::string Prefix = ".";
        const std::string Suffix = ".shuttlecopy-part";
        return Prefix + ShortenFileName(FileName, MAX_FILE_NAME_BYTES - Prefix.size() - Suffix.size()) + Suffix;
    }

    std::string RemotePartialPath(const std::string& RemotePath)
    {
        return JoinRemote(RemoteParent(RemotePath), PartialFileName(RemoteFileName(RemotePath)));
    }

    bool SameRemotePath(const std::string& First, const std::string& Second)
    {
        FS::path A = FS::path(First).lexically_normal();
        FS::path B = FS::path(Second).lexically_normal();
        if (!A.has_filename())
        {
            A = A.parent_path();
        }
        if (!B.has_filename())
        {
            B = B.parent_path();
        }
        return A == B;
    }
}
