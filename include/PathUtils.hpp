#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "TransferTypes.hpp"

namespace PathUtils
{
    // NAME_MAX on the filesystems we write to
    constexpr size_t MAX_FILE_NAME_BYTES = 255;

    // "host:path" is remote only when host is non-empty and has no '/', and path is non-empty.
    // Anything else, colon or not, is a local path.
    std::optional<RemoteLocation> ParseLocation(const std::string& Text);

    // Single-quote for a POSIX shell: ' becomes '\''
    std::string ShellQuote(const std::string& Text);

    std::string TrimTrailingSlashes(const std::string& RemotePath);
    std::string JoinRemote(const std::string& Base, const std::string& Relative);
    std::string RemoteParent(const std::string& RemotePath);
    std::string RemoteFileName(const std::string& RemotePath);

    std::string RemoveSpaces(const std::string& Component);

    // Applied to the destination-relative part only, never to the destination root
    std::string RemoveSpacesFromComponents(const std::string& RelativePath);

    // " (N)" inserted before the extension: "a.txt" -> "a (2).txt", "Makefile" -> "Makefile (2)"
    std::string NumberedName(const std::string& FileName, unsigned int Number);

    // Keeps at most MaxBytes of FileName, cutting the stem and keeping a short extension
    std::string ShortenFileName(const std::string& FileName, size_t MaxBytes);

    // Hidden sibling a transfer writes to before it is renamed over the real target
    std::string PartialFileName(const std::string& FileName);
    std::string RemotePartialPath(const std::string& RemotePath);

    // Same remote path after collapsing "//", "/./" and trailing slashes
    bool SameRemotePath(const std::string& First, const std::string& Second);
}
