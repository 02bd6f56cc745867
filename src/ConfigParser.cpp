#include <fstream>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <string>

#include "ConfigParser.hpp"

namespace FS = std::filesystem;

namespace
{
    std::string Trim(const std::string& Input)
    {
        std::string Result = Input;
        Result.erase(Result.begin(), std::find_if(Result.begin(), Result.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Result.erase(std::find_if(Result.rbegin(), Result.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Result.end());
        return Result;
    }

    std::string ToLower(std::string Input)
    {
        std::transform(Input.begin(), Input.end(), Input.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Input;
    }
}

const RunConfig& ConfigParser::GetConfig() const
{
    return Config;
}

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
    Config = RunConfig{};
    LogFileSet = false;
    Errors.clear();
    Infos.clear();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::IsAbsolutePath(const std::string& Path) const
{
#ifdef _WIN32
    if (Path.size() >= 3 && std::isalpha(static_cast<unsigned char>(Path[0])) && Path[1] == ':' && (Path[2] == '\\' || Path[2] == '/'))
    {
        return true;
    }

    if (Path.size() >= 2 && Path[0] == '\\' && Path[1] == '\\')
    {
        return true;
    }
    return false;
#else
    return !Path.empty() && Path[0] == '/';
#endif
}

bool ConfigParser::IsSinglePathComponent(const std::string& Name) const
{
    if (Name.empty() || Name == "." || Name == "..")
    {
        return false;
    }
    return Name.find('/') == std::string::npos && Name.find('\\') == std::string::npos;
}

std::optional<unsigned int> ConfigParser::ParseNumber(const std::string& Value, const std::string& Key, const std::string& Where, unsigned int Minimum)
{
    unsigned int ValueNum = 0;
    const char* Begin = Value.data();
    const char* End = Value.data() + Value.size();
    auto [Ptr, Ec] = std::from_chars(Begin, End, ValueNum);

    if (Value.empty() || Ec != std::errc() || Ptr != End)
    {
        AddError(Where + ": Invalid number for " + Key + ": '" + Value + "'.");
        return std::nullopt;
    }
    if (ValueNum < Minimum)
    {
        AddError(Where + ": " + Key + " must be at least " + std::to_string(Minimum) + ".");
        return std::nullopt;
    }
    return ValueNum;
}

std::optional<bool> ConfigParser::ParseYesNo(const std::string& Value, const std::string& Where)
{
    if (Value == "YES")
    {
        return true;
    }
    if (Value == "NO")
    {
        return false;
    }
    AddError(Where + ": Invalid Input '" + Value + "'. Use 'YES' or 'NO'.");
    return std::nullopt;
}

bool ConfigParser::Parse(const std::string& FilePath, const std::vector<std::string>& Overrides)
{
    if (!FilePath.empty())
    {
        ParseFile(FilePath);
    }
    ApplyOverrides(Overrides);
    Finalize();
    return Errors.empty();
}

void ConfigParser::ParseFile(const std::string& FilePath)
{
    if (!FS::exists(FilePath))
    {
        AddError("Config file does not exist: " + FilePath);
        return;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;
        Line = Trim(Line);

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        const std::string::size_type EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        Key.erase(std::remove_if(Key.begin(), Key.end(), [](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());

        ApplySetting(Key, Trim(Line.substr(EqualPos + 1)), "Line " + std::to_string(LineNumber));
    }
}

void ConfigParser::ApplyOverrides(const std::vector<std::string>& Overrides)
{
    for (const auto& Argument : Overrides)
    {
        const std::string Where = "Argument '" + Argument + "'";
        if (Argument.rfind("--", 0) != 0)
        {
            AddError(Where + ": Expected --Key=Value.");
            continue;
        }

        const std::string::size_type EqualPos = Argument.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError(Where + ": No '=' found.");
            continue;
        }

        ApplySetting(Argument.substr(2, EqualPos - 2), Trim(Argument.substr(EqualPos + 1)), Where);
    }
}

void ConfigParser::ApplySetting(const std::string& Key, const std::string& Value, const std::string& Where)
{
    if (Key == "RootFolder")
    {
        if (!IsAbsolutePath(Value))
        {
            AddError(Where + ": RootFolder path is not absolute.");
            return;
        }
        Config.RootFolder = FS::path(Value).lexically_normal();
    }

    else if (Key == "LogFile")
    {
        if (Value.empty())
        {
            AddError(Where + ": LogFile must not be empty.");
            return;
        }
        Config.LogFile = Value;
        LogFileSet = true;
    }

    else if (Key == "MaxRetries")
    {
        if (auto ValueNum = ParseNumber(Value, Key, Where, 1))
        {
            Config.MaxRetries = *ValueNum;
            AddInfo("MaxRetries set to " + std::to_string(*ValueNum));
        }
    }

    else if (Key == "RetryDelayMs")
    {
        if (auto ValueNum = ParseNumber(Value, Key, Where, 0))
        {
            Config.RetryDelay = std::chrono::milliseconds(*ValueNum);
            AddInfo("RetryDelayMs set to " + std::to_string(*ValueNum));
        }
    }

    else if (Key == "TestModeLimit")
    {
        if (auto ValueNum = ParseNumber(Value, Key, Where, 0))
        {
            Config.TestModeLimit = *ValueNum;
            if (*ValueNum > 0)
            {
                AddInfo("IMPORTANT - ! Test Mode Enabled, at most " + std::to_string(*ValueNum) + " archives will be processed !");
            }
        }
    }

    else if (Key == "ProcessingMode")
    {
        if (auto Mode = ToProcessingMode(ToLower(Value)))
        {
            Config.Mode = *Mode;
            AddInfo("ProcessingMode set to '" + ProcessingModeToString(*Mode) + "'.");
        }
        else
        {
            AddError(Where + ": Invalid ProcessingMode '" + Value + "'. Use 'normal' or 'validate-only' or 'validate-after'.");
        }
    }

    else if (Key == "DeleteArchivesAfterProcess")
    {
        if (auto Flag = ParseYesNo(Value, Where))
        {
            Config.DeleteArchivesAfterProcess = *Flag;
            if (*Flag)
            {
                AddInfo("IMPORTANT - ! Archives will be deleted after successful processing !");
            }
        }
    }

    else if (Key == "CleanupTempAfterProcess")
    {
        if (auto Flag = ParseYesNo(Value, Where))
        {
            Config.CleanupTempAfterProcess = *Flag;
        }
    }

    else if (Key == "FailOnItemErrors")
    {
        if (auto Flag = ParseYesNo(Value, Where))
        {
            Config.FailOnItemErrors = *Flag;
        }
    }

    else if (Key == "ArchiveExtension")
    {
        if (Value.size() < 2 || Value[0] != '.' || !IsSinglePathComponent(Value))
        {
            AddError(Where + ": ArchiveExtension must start with '.' and name an extension, e.g. '.zip'.");
            return;
        }
        Config.ArchiveExtension = ToLower(Value);
    }

    else if (Key == "TempFolderName")
    {
        if (!IsSinglePathComponent(Value))
        {
            AddError(Where + ": TempFolderName must be a single folder name.");
            return;
        }
        Config.TempFolderName = Value;
    }

    else if (Key == "ContentFolderName")
    {
        if (!IsSinglePathComponent(Value))
        {
            AddError(Where + ": ContentFolderName must be a single folder name.");
            return;
        }
        Config.ContentFolderName = Value;
    }

    else
    {
        AddError(Where + ": Unknown key '" + Key + "'.");
    }
}

void ConfigParser::Finalize()
{
    if (Config.RootFolder.empty())
    {
        AddError("No RootFolder provided.");
        return;
    }

    if (Config.TempFolderName == Config.ContentFolderName)
    {
        AddError("TempFolderName and ContentFolderName must differ.");
    }

    if (!LogFileSet)
    {
        Config.LogFile = Config.RootFolder / "takeout_merge.log";
    }
}
