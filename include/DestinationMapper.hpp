#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "TransferTypes.hpp"

// Destination = root + relative part. The relative part is computed once per file,
// '/'-separated, then joined onto a local or remote root.
namespace DestinationMapper
{
    // std::nullopt when a Directory-source file does not lie under the source root
    std::optional<std::string> RelativeDestination(const std::filesystem::path& SourceFile, const SourceDescriptor& Source, TransferMode Mode);
    std::optional<std::string> RelativeDestinationForRemote(const std::string& RemoteFile, const std::string& RemoteRoot, TransferMode Mode);

    std::filesystem::path ToLocal(const std::filesystem::path& DestRoot, const std::string& Relative, bool StripSpaces);
    std::string ToRemote(const std::string& DestRoot, const std::string& Relative, bool StripSpaces);
}
