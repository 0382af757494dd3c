#include "ProcessRunner.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    void CloseIfOpen(int& Fd)
    {
        if (Fd >= 0)
        {
            close(Fd);
            Fd = -1;
        }
    }

    // Reads both pipes until EOF so neither side can fill up and stall the child
    void DrainPipes(int OutFd, int ErrFd, std::string& Out, std::string& Err)
    {
        char Buffer[8192];
        pollfd Fds[2] = { { OutFd, POLLIN, 0 }, { ErrFd, POLLIN, 0 } };
        int Open = 2;

        while (Open > 0)
        {
            int Ready = poll(Fds, 2, -1);
            if (Ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                break;
            }

            for (int i = 0; i < 2; ++i)
            {
                if (Fds[i].fd < 0 || Fds[i].revents == 0)
                {
                    continue;
                }

                ssize_t Count = read(Fds[i].fd, Buffer, sizeof(Buffer));
                if (Count > 0)
                {
                    (i == 0 ? Out : Err).append(Buffer, static_cast<size_t>(Count));
                }
                else if (Count == 0 || errno != EINTR)
                {
                    close(Fds[i].fd);
                    Fds[i].fd = -1;
                    --Open;
                }
            }
        }
    }
}

ProcessResult ProcessRunner::Run(const std::vector<std::string>& Args)
{
    if (Args.empty())
    {
        throw std::runtime_error("ProcessRunner: empty command line");
    }

    int OutPipe[2] = { -1, -1 };
    int ErrPipe[2] = { -1, -1 };
    if (pipe2(OutPipe, O_CLOEXEC) != 0)
    {
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }
    if (pipe2(ErrPipe, O_CLOEXEC) != 0)
    {
        int SavedErrno = errno;
        CloseIfOpen(OutPipe[0]);
        CloseIfOpen(OutPipe[1]);
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(SavedErrno));
    }

    std::vector<char*> Argv;
    Argv.reserve(Args.size() + 1);
    for (const auto& Arg : Args)
    {
        Argv.push_back(const_cast<char*>(Arg.c_str()));
    }
    Argv.push_back(nullptr);

    const pid_t Pid = fork();
    if (Pid < 0)
    {
        int SavedErrno = errno;
        CloseIfOpen(OutPipe[0]);
        CloseIfOpen(OutPipe[1]);
        CloseIfOpen(ErrPipe[0]);
        CloseIfOpen(ErrPipe[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(SavedErrno));
    }

    if (Pid == 0)
    {
        // Child: no stdin, stdout/stderr into the pipes
        int DevNull = open("/dev/null", O_RDONLY);
        if (DevNull >= 0)
        {
            dup2(DevNull, STDIN_FILENO);
            close(DevNull);
        }
        dup2(OutPipe[1], STDOUT_FILENO);
        dup2(ErrPipe[1], STDERR_FILENO);

        execvp(Argv[0], Argv.data());
        _exit(127); // exec failed
    }

    CloseIfOpen(OutPipe[1]);
    CloseIfOpen(ErrPipe[1]);

    ProcessResult Result;
    DrainPipes(OutPipe[0], ErrPipe[0], Result.StdOut, Result.StdErr);

    int Status = 0;
    pid_t Waited;
    do
    {
        Waited = waitpid(Pid, &Status, 0);
    } while (Waited < 0 && errno == EINTR);

    if (Waited < 0)
    {
        Result.ExitCode = -1;
    }
    else if (WIFEXITED(Status))
    {
        Result.ExitCode = WEXITSTATUS(Status);
    }
    else if (WIFSIGNALED(Status))
    {
        Result.ExitCode = 128 + WTERMSIG(Status);
    }
    return Result;
}

bool ProcessRunner::FindInPath(const std::string& Tool)
{
    if (Tool.find('/') != std::string::npos)
    {
        return access(Tool.c_str(), X_OK) == 0;
    }

    const char* PathEnv = std::getenv("PATH");
    if (PathEnv == nullptr)
    {
        return false;
    }

    std::stringstream Dirs(PathEnv);
    std::string Dir;
    while (std::getline(Dirs, Dir, ':'))
    {
        if (Dir.empty())
        {
            Dir = ".";
        }
        std::string Candidate = Dir + "/" + Tool;
        if (access(Candidate.c_str(), X_OK) == 0)
        {
            return true;
        }
    }
    return false;
}

std::string ProcessRunner::Trim(const std::string& Text)
{
    const char* Whitespace = " \t\r\n";
    size_t Start = Text.find_first_not_of(Whitespace);
    if (Start == std::string::npos)
    {
        return "";
    }
    size_t End = Text.find_last_not_of(Whitespace);
    return Text.substr(Start, End - Start + 1);
}
