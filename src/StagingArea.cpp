#include "StagingArea.hpp"
#include "FileHasher.hpp"
#include "PathUtils.hpp"
#include "TransferTypes.hpp"
#include "Logger.hpp"

#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    // Unique per instance, so two relays in one process never share a directory
    FS::path MakeRelayDirectory(const FS::path& Root)
    {
        std::error_code Ec;
        FS::create_directories(Root, Ec);
        if (Ec)
        {
            throw TransferFatalError("Failed to create staging root " + Root.string() + ": " + Ec.message());
        }

        std::string Template = (Root / ("shuttlecopy_relay_" + std::to_string(getpid()) + "_XXXXXX")).string();
        std::vector<char> Buffer(Template.begin(), Template.end());
        Buffer.push_back('\0');
        if (mkdtemp(Buffer.data()) == nullptr)
        {
            throw TransferFatalError("Failed to create staging directory under " + Root.string() + ": " + std::strerror(errno));
        }
        return FS::path(Buffer.data());
    }
}

StagingArea::StagingArea(const FS::path& Root)
    : Directory(MakeRelayDirectory(Root))
{
    Log.Info(std::string("[Staging] Relay directory: ") + Directory.string());
}

StagingArea::~StagingArea()
{
    std::error_code Ec;
    FS::remove_all(Directory, Ec);
    if (Ec)
    {
        Log.Warn(std::string("[Staging] Could not remove relay directory ") + Directory.string() + ": " + Ec.message());
    }
}

FS::path StagingArea::StagedPathFor(const std::string& Host, const std::string& RemotePath) const
{
    const std::string Prefix = FileHasher::PathFingerprint(Host, RemotePath) + "_";
    return Directory / (Prefix + PathUtils::ShortenFileName(PathUtils::RemoteFileName(RemotePath), PathUtils::MAX_FILE_NAME_BYTES - Prefix.size()));
}

const FS::path& StagingArea::GetDirectory() const
{
    return Directory;
}

void StagingArea::Discard(const FS::path& StagedFile) const
{
    std::error_code Ec;
    FS::remove(StagedFile, Ec);
    if (Ec)
    {
        Log.Warn(std::string("[Staging] Could not remove staged file ") + StagedFile.string() + ": " + Ec.message());
    }
}
