#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    bool ConsoleEcho;

    unsigned short int MaxLogFiles;
    unsigned short int SSHControlPersist;

    std::string SSHControlPath;
    std::filesystem::path StagingRoot;
    std::vector<std::string> DefaultExcludes;

    void InitializeDefaults()
    {
        ConfigFile = "ShuttleCopy.conf"; //Looked up in the working directory, --config overrides it
        LogDir = ""; //Empty disables the log file
        ConsoleEcho = false;
        MaxLogFiles = 10;
        SSHControlPersist = 60; //Seconds the master connection outlives the last command
        SSHControlPath = "/tmp/shuttlecopy_ssh_%h_%p_%r";

        std::error_code ec;
        StagingRoot = std::filesystem::temp_directory_path(ec);
        if (ec)
        {
            StagingRoot = "/tmp";
        }
        DefaultExcludes.clear();
    }
}
