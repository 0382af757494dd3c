#include "FileCopier.hpp"
#include "ProcessRunner.hpp"
#include "Logger.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    constexpr size_t READ_WRITE_BUFFER_SIZE = 1024 * 1024;

    std::once_flag CopyFileRangeCheckFlag;

    // Closes on scope exit
    class FileDescriptor
    {
    public:
        explicit FileDescriptor(int Fd) : Fd(Fd) {}
        ~FileDescriptor()
        {
            if (Fd >= 0)
            {
                close(Fd);
            }
        }
        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        int Get() const { return Fd; }

    private:
        int Fd;
    };
}

bool FileCopier::CopyFileRangeSupported = true;

void FileCopier::CheckCopyFileRangeSupport()
{
    int srcFd = open("/dev/null", O_RDONLY);
    int destFd = open("/dev/null", O_WRONLY);
    if (srcFd < 0 || destFd < 0) {
        if (srcFd >= 0) close(srcFd);
        if (destFd >= 0) close(destFd);
        CopyFileRangeSupported = false;
        Log.Info(std::string("[FileCopier] copy_file_range not supported"));
        return;
    }

    ssize_t result = copy_file_range(srcFd, nullptr, destFd, nullptr, 1, 0);
    CopyFileRangeSupported = (result >= 0 || errno != ENOSYS);

    close(srcFd);
    close(destFd);
}

bool FileCopier::CopyWithReadWrite(int SrcFd, int DestFd, std::string& Error)
{
    std::vector<char> Buffer(READ_WRITE_BUFFER_SIZE);
    while (true)
    {
        ssize_t Got = read(SrcFd, Buffer.data(), Buffer.size());
        if (Got == 0)
        {
            return true;
        }
        if (Got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            Error = std::string("read failed: ") + strerror(errno);
            return false;
        }

        ssize_t Written = 0;
        while (Written < Got)
        {
            ssize_t Put = write(DestFd, Buffer.data() + Written, static_cast<size_t>(Got - Written));
            if (Put < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                Error = std::string("write failed: ") + strerror(errno);
                return false;
            }
            Written += Put;
        }
    }
}

bool FileCopier::CopyLocalFile(const FS::path& Source, const FS::path& Destination, std::string& Error)
{
    std::call_once(CopyFileRangeCheckFlag, &FileCopier::CheckCopyFileRangeSupport);

    FileDescriptor Src(open(Source.c_str(), O_RDONLY | O_CLOEXEC));
    if (Src.Get() < 0)
    {
        Error = std::string("cannot open source: ") + strerror(errno);
        Log.Error(std::string("[FileCopier] Failed to open source file: ") + Source.string());
        return false;
    }

    struct stat StatBuf;
    if (fstat(Src.Get(), &StatBuf) != 0)
    {
        Error = std::string("cannot stat source: ") + strerror(errno);
        return false;
    }

    FileDescriptor Dest(open(Destination.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, StatBuf.st_mode & 07777));
    if (Dest.Get() < 0)
    {
        Error = std::string("cannot open destination: ") + strerror(errno);
        Log.Error(std::string("[FileCopier] Failed to open destination file: ") + Destination.string());
        return false;
    }

    bool UseReadWrite = !CopyFileRangeSupported;
    if (!UseReadWrite)
    {
        off_t Remaining = StatBuf.st_size;
        while (Remaining > 0)
        {
            ssize_t Copied = copy_file_range(Src.Get(), nullptr, Dest.Get(), nullptr, static_cast<size_t>(Remaining), 0);
            if (Copied < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                // Cross-filesystem or unsupported file types: only safe to fall back before any byte moved
                if ((errno == EXDEV || errno == EINVAL || errno == EOPNOTSUPP || errno == ENOSYS) && Remaining == StatBuf.st_size)
                {
                    UseReadWrite = true;
                    break;
                }
                Error = std::string("copy_file_range failed: ") + strerror(errno);
                return false;
            }
            if (Copied == 0)
            {
                break;
            }
            Remaining -= Copied;
        }
    }

    if (UseReadWrite && !CopyWithReadWrite(Src.Get(), Dest.Get(), Error))
    {
        return false;
    }

    if (fchmod(Dest.Get(), StatBuf.st_mode & 07777) != 0)
    {
        Log.Warn(std::string("[FileCopier] Could not copy permissions to ") + Destination.string() + ": " + strerror(errno));
    }
    return true;
}

bool FileCopier::SyncLocalFile(const FS::path& Source, const FS::path& Destination, std::string& Error)
{
    ProcessResult Result = ProcessRunner::Run({ "rsync", "-a", "--checksum", Source.string(), Destination.string() });
    if (!Result.Succeeded())
    {
        Error = "rsync failed (exit code " + std::to_string(Result.ExitCode) + ")";
        std::string Detail = ProcessRunner::Trim(Result.StdErr);
        if (!Detail.empty())
        {
            Error += ": " + Detail;
        }
        return false;
    }
    return true;
}

bool FileCopier::Copy(const FS::path& Source, const FS::path& Destination, TransferMethod Method, std::string& Error)
{
    Log.Info(std::string("[FileCopier] Copying File: ") + Source.string() + std::string(" -> ") + Destination.string());
    if (Method == TransferMethod::Rsync)
    {
        return SyncLocalFile(Source, Destination, Error);
    }
    return CopyLocalFile(Source, Destination, Error);
}

bool FileCopier::TryRename(const FS::path& Source, const FS::path& Destination, std::string& Error)
{
    std::error_code Ec;
    FS::rename(Source, Destination, Ec);
    if (Ec)
    {
        Error = Ec.message();
        return false;
    }
    return true;
}
