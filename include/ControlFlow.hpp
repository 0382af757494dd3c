#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ConfigParser.hpp"
#include "TransferEvent.hpp"
#include "TransferTypes.hpp"

struct CommandLineOptions
{
    std::string Source;
    std::vector<std::string> SourceFiles;
    std::string Destination;
    std::string ConfigFile;
    bool Move = false;
    bool StripSpaces = false;
    bool ShowHelp = false;
    ConflictPolicy Conflict = ConflictPolicy::Skip;
    TransferMode Mode = TransferMode::FilesOnly;
    TransferMethod Method = TransferMethod::Standard;
    std::vector<std::string> Excludes;
};

class ControlFlow
{
public:
    ControlFlow();

    int Run(int argc, char* argv[]);

    // Shared with the signal handler installed by main
    std::shared_ptr<std::atomic<bool>> GetCancelFlag() const;

    static bool ParseArguments(int argc, char* argv[], CommandLineOptions& Options, std::string& Error);

    // Throws TransferFatalError when the source text cannot be used
    static TransferConfig BuildTransferConfig(const CommandLineOptions& Options, const std::vector<std::string>& DefaultExcludes);

    static nlohmann::json ResultToJson(const TransferEvent& Terminal);
    static nlohmann::json ErrorJson(const std::string& Message);
    static int ExitCodeFor(const TransferEvent& Terminal);

private:
    ConfigParser Parser;
    std::shared_ptr<std::atomic<bool>> CancelFlag;

    bool LoadConfig(const std::string& ExplicitConfigFile, std::string& Error);
    void LogRunSettings(const TransferConfig& Config);
    static void PrintUsage();
};
