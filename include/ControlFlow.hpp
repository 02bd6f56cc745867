#pragma once

#include <string>
#include <vector>

#include "ConfigParser.hpp"
#include "BatchScheduler.hpp"

class ControlFlow
{
public:
    static constexpr int ExitSuccess = 0;
    static constexpr int ExitRunFailure = 1;
    static constexpr int ExitConfigError = 2;

    ControlFlow() = default;

    // argv: [ConfigFile] [--Key=Value ...]
    int Run(int argc, char* argv[]);
    int Run(const std::string& ConfigFile, const std::vector<std::string>& Overrides);

private:
    ConfigParser Parser;

    void LogRunConfig(const RunConfig& Config);
    void LogSummary(const BatchReport& Report);
};
