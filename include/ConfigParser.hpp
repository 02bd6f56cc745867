#pragma once

#include <string>
#include <vector>
#include <optional>

#include "RunConfig.hpp"

class ConfigParser
{
public:
    ConfigParser() = default;

    // Reads FilePath (skipped when empty), then applies "--Key=Value" overrides on top.
    // Returns false when any error was collected; the run must not start in that case.
    bool Parse(const std::string& FilePath, const std::vector<std::string>& Overrides = {});

    const RunConfig& GetConfig() const;
    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    void Reset();

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    void ParseFile(const std::string& FilePath);
    void ApplyOverrides(const std::vector<std::string>& Overrides);
    void ApplySetting(const std::string& Key, const std::string& Value, const std::string& Where);
    void Finalize();

    std::optional<unsigned int> ParseNumber(const std::string& Value, const std::string& Key, const std::string& Where, unsigned int Minimum);
    std::optional<bool> ParseYesNo(const std::string& Value, const std::string& Where);

    bool IsAbsolutePath(const std::string& Path) const;
    bool IsSinglePathComponent(const std::string& Name) const;

    RunConfig Config;
    bool LogFileSet = false;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
