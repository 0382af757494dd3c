#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

void Logger::Init(const std::string& logDir)
{
    if (logDir.empty())
    {
        return;
    }

    std::error_code ec;
    if (!FS::exists(logDir, ec))
    {
        FS::create_directories(logDir, ec);
        if (ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << logDir << " - " << ec.message() << "\n";
            return;
        }
    }

    LogDirectory = logDir;
    CurrentLogFilePath = (FS::path(logDir) / ("Transfer_Log" + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);

    Info("Transfer Log Started at " + GetTimestamp());
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        LogFile << "[" << GetTimestamp() << "] [INFO] Transfer Log Closed\n";
        LogFile.close();
    }
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

void Logger::SetConsoleEcho(bool Enabled)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    EchoToConsole = Enabled;
}

void Logger::CleanupOldLogs()
{
    if (LogDirectory.empty())
    {
        return;
    }

    std::vector<FS::directory_entry> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(LogDirectory, ec))
    {
        if (Entry.is_regular_file() && Entry.path().filename().string().find("Transfer_Log") == 0)
        {
            Logs.push_back(Entry);
        }
    }

    if ((int)Logs.size() <= ConfigGlobal::MaxLogFiles)
    {
        return;
    }

    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    while ((int)Logs.size() > ConfigGlobal::MaxLogFiles)
    {
        std::error_code RemoveError;
        if (!FS::remove(Logs.front(), RemoveError) && RemoveError)
        {
            std::cerr << "Logger: Could not remove old log " << Logs.front().path() << " - " << RemoveError.message() << "\n";
        }
        Logs.erase(Logs.begin());
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (EchoToConsole)
    {
        std::cerr << "[" << LevelToString(Level) << "] " << Message << "\n";
    }

    if (!LogFile.is_open())
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Log(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S");
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
