#include <getopt.h>

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"
#include "PathUtils.hpp"
#include "TransferEngine.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    enum OptionId
    {
        OPT_SRC = 1000,
        OPT_SRC_FILES,
        OPT_DST,
        OPT_MOVE,
        OPT_CONFLICT,
        OPT_STRIP_SPACES,
        OPT_MODE,
        OPT_METHOD,
        OPT_EXCLUDE,
        OPT_CONFIG
    };

    const struct option LongOptions[] = {
        { "src",          required_argument, nullptr, OPT_SRC },
        { "src-files",    required_argument, nullptr, OPT_SRC_FILES },
        { "dst",          required_argument, nullptr, OPT_DST },
        { "move",         no_argument,       nullptr, OPT_MOVE },
        { "conflict",     required_argument, nullptr, OPT_CONFLICT },
        { "strip-spaces", no_argument,       nullptr, OPT_STRIP_SPACES },
        { "mode",         required_argument, nullptr, OPT_MODE },
        { "method",       required_argument, nullptr, OPT_METHOD },
        { "exclude",      required_argument, nullptr, OPT_EXCLUDE },
        { "config",       required_argument, nullptr, OPT_CONFIG },
        { "help",         no_argument,       nullptr, 'h' },
        { nullptr, 0, nullptr, 0 }
    };

    std::vector<std::string> SplitCommaList(const std::string& Text)
    {
        std::vector<std::string> Items;
        std::stringstream Stream(Text);
        std::string Item;
        while (std::getline(Stream, Item, ','))
        {
            if (!Item.empty())
            {
                Items.push_back(Item);
            }
        }
        return Items;
    }
}

ControlFlow::ControlFlow()
    : CancelFlag(std::make_shared<std::atomic<bool>>(false))
{
}

std::shared_ptr<std::atomic<bool>> ControlFlow::GetCancelFlag() const
{
    return CancelFlag;
}

void ControlFlow::PrintUsage()
{
    std::cerr << "Usage: shuttlecopy (--src <dir|host:path> | --src-files <f1,f2,...>) --dst <dir|host:path>\n"
              << "                   [--move] [--conflict skip|overwrite|rename] [--strip-spaces]\n"
              << "                   [--mode files|folders] [--method standard|rsync]\n"
              << "                   [--exclude <rule>]... [--config <file>]\n";
}

bool ControlFlow::ParseArguments(int argc, char* argv[], CommandLineOptions& Options, std::string& Error)
{
    optind = 0; //Full rescan, parsing may run more than once per process
    opterr = 0;

    int Opt;
    while ((Opt = getopt_long(argc, argv, ":h", LongOptions, nullptr)) != -1)
    {
        switch (Opt)
        {
        case OPT_SRC:
            Options.Source = optarg;
            break;
        case OPT_SRC_FILES:
            Options.SourceFiles = SplitCommaList(optarg);
            break;
        case OPT_DST:
            Options.Destination = optarg;
            break;
        case OPT_MOVE:
            Options.Move = true;
            break;
        case OPT_CONFLICT:
        {
            std::optional<ConflictPolicy> Policy = ToConflictPolicy(optarg);
            if (!Policy)
            {
                Error = std::string("Invalid --conflict value: ") + optarg;
                return false;
            }
            Options.Conflict = *Policy;
            break;
        }
        case OPT_STRIP_SPACES:
            Options.StripSpaces = true;
            break;
        case OPT_MODE:
        {
            std::optional<TransferMode> Mode = ToTransferMode(optarg);
            if (!Mode)
            {
                Error = std::string("Invalid --mode value: ") + optarg;
                return false;
            }
            Options.Mode = *Mode;
            break;
        }
        case OPT_METHOD:
        {
            std::optional<TransferMethod> Method = ToTransferMethod(optarg);
            if (!Method)
            {
                Error = std::string("Invalid --method value: ") + optarg;
                return false;
            }
            Options.Method = *Method;
            break;
        }
        case OPT_EXCLUDE:
            Options.Excludes.push_back(optarg);
            break;
        case OPT_CONFIG:
            Options.ConfigFile = optarg;
            break;
        case 'h':
            Options.ShowHelp = true;
            return true;
        case ':':
            Error = std::string("Missing value for ") + argv[optind - 1];
            return false;
        default:
            Error = std::string("Unknown argument: ") + argv[optind - 1];
            return false;
        }
    }

    if (optind < argc)
    {
        Error = std::string("Unexpected argument: ") + argv[optind];
        return false;
    }
    if (!Options.Source.empty() && !Options.SourceFiles.empty())
    {
        Error = "--src and --src-files cannot be used together";
        return false;
    }
    if (Options.Source.empty() && Options.SourceFiles.empty())
    {
        Error = "One of --src or --src-files is required";
        return false;
    }
    if (Options.Destination.empty())
    {
        Error = "--dst is required";
        return false;
    }
    return true;
}

TransferConfig ControlFlow::BuildTransferConfig(const CommandLineOptions& Options, const std::vector<std::string>& DefaultExcludes)
{
    TransferConfig Config;

    if (!Options.SourceFiles.empty())
    {
        std::vector<FS::path> Files(Options.SourceFiles.begin(), Options.SourceFiles.end());
        Config.Source = SourceDescriptor::FromFiles(std::move(Files));
    }
    else if (std::optional<RemoteLocation> Remote = PathUtils::ParseLocation(Options.Source))
    {
        Config.Source = SourceDescriptor::FromRemote(Remote->Host, Remote->Path);
    }
    else if (Options.Source.find(':') != std::string::npos && !FS::exists(Options.Source))
    {
        throw TransferFatalError("Remote source must be given as host:path: " + Options.Source);
    }
    else
    {
        Config.Source = SourceDescriptor::FromDirectory(Options.Source);
    }

    Config.Destination = Options.Destination;
    Config.Move = Options.Move;
    Config.Conflict = Options.Conflict;
    Config.StripSpaces = Options.StripSpaces;
    Config.Mode = Options.Mode;
    Config.Method = Options.Method;

    Config.Exclusions = DefaultExcludes;
    Config.Exclusions.insert(Config.Exclusions.end(), Options.Excludes.begin(), Options.Excludes.end());
    return Config;
}

nlohmann::json ControlFlow::ErrorJson(const std::string& Message)
{
    return nlohmann::json{ { "status", "error" }, { "message", Message } };
}

nlohmann::json ControlFlow::ResultToJson(const TransferEvent& Terminal)
{
    if (Terminal.Kind == EventKind::FatalError || Terminal.Kind == EventKind::Progress)
    {
        return ErrorJson(Terminal.Message);
    }

    const TransferOutcome& Outcome = Terminal.Outcome;
    nlohmann::json Result;
    Result["status"] = (Terminal.Kind == EventKind::Cancelled) ? "cancelled" : "finished";
    Result["copied"] = Outcome.Copied;
    Result["skipped"] = Outcome.Skipped;
    Result["excluded_files"] = Outcome.ExcludedFiles;
    Result["excluded_dirs"] = Outcome.ExcludedDirs;
    Result["errors"] = Outcome.Errors;
    Result["warnings"] = Outcome.Warnings;
    return Result;
}

int ControlFlow::ExitCodeFor(const TransferEvent& Terminal)
{
    if (Terminal.Kind == EventKind::FatalError || Terminal.Kind == EventKind::Progress)
    {
        return 1;
    }
    if (!Terminal.Outcome.Errors.empty() || !Terminal.Outcome.Warnings.empty())
    {
        return 2;
    }
    return 0;
}

bool ControlFlow::LoadConfig(const std::string& ExplicitConfigFile, std::string& Error)
{
    std::string ConfigPath = ExplicitConfigFile.empty() ? ConfigGlobal::ConfigFile : ExplicitConfigFile;

    std::error_code ec;
    if (ExplicitConfigFile.empty() && !FS::exists(ConfigPath, ec))
    {
        return true;
    }

    if (!Parser.Parse(ConfigPath))
    {
        Error = "Config errors in " + ConfigPath + ":";
        for (const auto& ConfigError : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << ConfigError << "\n";
            Error += " " + ConfigError;
        }
        return false;
    }
    ConfigGlobal::ConfigFile = ConfigPath;
    return true;
}

void ControlFlow::LogRunSettings(const TransferConfig& Config)
{
    Log.Info(std::string("Destination: ") + Config.Destination);
    switch (Config.Source.Kind)
    {
    case SourceKind::Directory:
        Log.Info(std::string("Source Directory: ") + Config.Source.Directory.string());
        break;
    case SourceKind::FileList:
        for (const auto& File : Config.Source.Files)
        {
            Log.Info(std::string("Source File: ") + File.string());
        }
        break;
    case SourceKind::Remote:
        Log.Info(std::string("Remote Source: ") + Config.Source.Host + ":" + Config.Source.RemoteRoot);
        break;
    case SourceKind::None:
        break;
    }
    for (const auto& Rule : Config.Exclusions)
    {
        Log.Info(std::string("Exclude: ") + Rule);
    }
    Log.Info(std::string("Move: ") + (Config.Move ? "YES" : "NO") + std::string(" | Strip Spaces: ") + (Config.StripSpaces ? "YES" : "NO"));
}

int ControlFlow::Run(int argc, char* argv[])
{
    CommandLineOptions Options;
    std::string Error;
    if (!ParseArguments(argc, argv, Options, Error))
    {
        std::cout << ErrorJson(Error).dump() << std::endl;
        PrintUsage();
        return 1;
    }
    if (Options.ShowHelp)
    {
        PrintUsage();
        return 0;
    }

    if (!LoadConfig(Options.ConfigFile, Error))
    {
        std::cout << ErrorJson(Error).dump() << std::endl;
        return 1;
    }

    Log.Init(ConfigGlobal::LogDir);
    Log.SetConsoleEcho(ConfigGlobal::ConsoleEcho);
    Log.CleanupOldLogs();
    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info(Info);
    }

    TransferConfig Config;
    try
    {
        Config = BuildTransferConfig(Options, ConfigGlobal::DefaultExcludes);
    }
    catch (const TransferFatalError& Ex)
    {
        Log.Error(Ex.what());
        std::cout << ErrorJson(Ex.what()).dump() << std::endl;
        return 1;
    }
    Config.CancelFlag = CancelFlag;
    LogRunSettings(Config);

    TransferEngine Engine;
    TransferEvent Terminal = Engine.RunToCompletion(std::move(Config), [](const TransferEvent& Progress)
    {
        std::cerr << "[" << Progress.Done << "/" << Progress.Total << "] " << Progress.CurrentFile << "\n";
        Log.Info(std::string("Progress ") + std::to_string(Progress.Done) + "/" + std::to_string(Progress.Total) + ": " + Progress.CurrentFile);
    });

    switch (Terminal.Kind)
    {
    case EventKind::Finished:
        Log.Info("Transfer Finished");
        break;
    case EventKind::Cancelled:
        Log.Warn("Transfer Cancelled");
        break;
    default:
        Log.Error(std::string("Transfer Failed: ") + Terminal.Message);
        break;
    }

    std::cout << ResultToJson(Terminal).dump() << std::endl;
    if (!Log.CurrentLogFilePath.empty())
    {
        std::cerr << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    }
    return ExitCodeFor(Terminal);
}
