#include "PartialFile.hpp"
#include "PathUtils.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

PartialFile::PartialFile(const FS::path& Target)
    : Path(Target.parent_path() / PathUtils::PartialFileName(Target.filename().string()))
{
}

PartialFile::~PartialFile()
{
    if (Committed)
    {
        return;
    }

    std::error_code Ec;
    FS::remove(Path, Ec);
    if (Ec)
    {
        Log.Warn(std::string("[PartialFile] Could not remove ") + Path.string() + ": " + Ec.message());
    }
}

const FS::path& PartialFile::GetPath() const
{
    return Path;
}

bool PartialFile::CommitTo(const FS::path& Target, std::string& Error)
{
    std::error_code Ec;
    FS::rename(Path, Target, Ec);
    if (Ec)
    {
        Error = Ec.message();
        return false;
    }
    Committed = true;
    return true;
}
