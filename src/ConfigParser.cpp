#include <iostream>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"

namespace FS = std::filesystem;

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Errors.clear();
    Infos.clear();

    ConfigGlobal::InitializeDefaults();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::ParseYesNo(const std::string& Value, int LineNumber, bool& Out)
{
    if (Value == "YES")
    {
        Out = true;
        return true;
    }
    if (Value == "NO")
    {
        Out = false;
        return true;
    }
    AddError("Line " + std::to_string(LineNumber) + ": Invalid Input. Use 'YES' or 'NO'.");
    return false;
}

bool ConfigParser::ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned short int& Out)
{
    try
    {
        size_t Consumed = 0;
        int ValueNum = std::stoi(Value, &Consumed);
        if (Consumed != Value.size())
        {
            AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
            return false;
        }
        if (ValueNum <= 0 || ValueNum > 65535)
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must be between 1 and 65,535.");
            return false;
        }
        Out = static_cast<unsigned short int>(ValueNum);
        AddInfo(Key + " set to " + std::to_string(ValueNum));
        return true;
    }
    catch (const std::exception&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
        return false;
    }
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    std::error_code ec;
    if (!FS::exists(FilePath, ec))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;

        // Trim leading whitespace
        Line.erase(Line.begin(), std::find_if(Line.begin(), Line.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        // Trim trailing whitespace
        Line.erase(std::find_if(Line.rbegin(), Line.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Line.end());

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Line.substr(EqualPos + 1);

        Key.erase(std::remove_if(Key.begin(), Key.end(),[](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        Value.erase(Value.begin(), std::find_if(Value.begin(), Value.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Value.erase(std::find_if(Value.rbegin(), Value.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Value.end());

        if (Key == "LogDir")
        {
            if (Value.empty())
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": Empty LogDir, log file disabled.");
            }
            ConfigGlobal::LogDir = Value;
        }

        else if (Key == "MaxLogFiles")
        {
            ParseCount(Key, Value, LineNumber, ConfigGlobal::MaxLogFiles);
        }

        else if (Key == "ConsoleEcho")
        {
            ParseYesNo(Value, LineNumber, ConfigGlobal::ConsoleEcho);
        }

        else if (Key == "SSHControlPath")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": SSHControlPath cannot be empty.");
                continue;
            }
            ConfigGlobal::SSHControlPath = Value;
        }

        else if (Key == "SSHControlPersist")
        {
            ParseCount(Key, Value, LineNumber, ConfigGlobal::SSHControlPersist);
        }

        else if (Key == "StagingRoot")
        {
            if (Value.empty() || Value[0] != '/')
            {
                AddError("Line " + std::to_string(LineNumber) + ": StagingRoot path is not absolute.");
                continue;
            }
            ConfigGlobal::StagingRoot = Value;
        }

        else if (Key == "Exclude")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": Empty exclude rule.");
                continue;
            }
            if (std::find(ConfigGlobal::DefaultExcludes.begin(), ConfigGlobal::DefaultExcludes.end(), Value) != ConfigGlobal::DefaultExcludes.end())
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate exclude rule '" + Value + "'. Ignored.");
                continue;
            }
            ConfigGlobal::DefaultExcludes.push_back(Value);
        }

        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
            continue;
        }
    }

    return Errors.empty();
}
