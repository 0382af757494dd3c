#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern bool ConsoleEcho;

    extern unsigned short int MaxLogFiles;
    extern unsigned short int SSHControlPersist;

    extern std::string SSHControlPath;
    extern std::filesystem::path StagingRoot;
    extern std::vector<std::string> DefaultExcludes;

    void InitializeDefaults();
}
