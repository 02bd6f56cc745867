#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include "ControlFlow.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    const char* DEFAULT_CONFIG_FILE = "Config.txt";

    std::string YesNo(bool Flag)
    {
        return Flag ? "YES" : "NO";
    }
}

int ControlFlow::Run(int argc, char* argv[])
{
    std::string ConfigFile;
    std::vector<std::string> Overrides;

    for (int i = 1; i < argc; ++i)
    {
        std::string Argument(argv[i]);
        if (i == 1 && Argument.rfind("--", 0) != 0)
        {
            ConfigFile = Argument;
            continue;
        }
        Overrides.push_back(Argument);
    }

    // Without an explicit config file, Config.txt is used when present; overrides alone are enough otherwise.
    if (ConfigFile.empty() && FS::exists(DEFAULT_CONFIG_FILE))
    {
        ConfigFile = DEFAULT_CONFIG_FILE;
    }

    return Run(ConfigFile, Overrides);
}

int ControlFlow::Run(const std::string& ConfigFile, const std::vector<std::string>& Overrides)
{
    Parser.Reset();
    if (!Parser.Parse(ConfigFile, Overrides))
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
        }
        std::cerr << "Usage: takeout_merge [ConfigFile] [--Key=Value ...]\n";
        std::cerr << "Check Errors and Fix Them, Exiting\n";
        return ExitConfigError;
    }

    const RunConfig& Config = Parser.GetConfig();

    if (!Log.Init(Config.LogFile.string()))
    {
        std::cerr << "Continuing with console output only.\n";
    }

    Log.Info("TakeoutMerge started");
    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info("Config: " + Info);
    }
    LogRunConfig(Config);

    BatchScheduler Scheduler(Config);
    BatchReport Report;
    try
    {
        Report = Scheduler.Run();
    }
    catch (const FS::filesystem_error& e)
    {
        Log.Error(std::string("Cannot scan root folder: ") + e.what());
        return ExitRunFailure;
    }

    LogSummary(Report);
    Log.Success("All files processed. Log saved to: " + Log.CurrentLogFilePath);

    if (Config.FailOnItemErrors && Report.HasFailures())
    {
        Log.Error("One or more archives failed and FailOnItemErrors is set.");
        return ExitRunFailure;
    }
    return ExitSuccess;
}

void ControlFlow::LogRunConfig(const RunConfig& Config)
{
    Log.Info("Root folder:      " + Config.RootFolder.string());
    Log.Info("Log file:         " + Config.LogFile.string());
    Log.Info("Processing mode:  " + ProcessingModeToString(Config.Mode));
    Log.Info("Max retries:      " + std::to_string(Config.MaxRetries) + " (delay " + std::to_string(Config.RetryDelay.count()) + " ms)");
    Log.Info("Parallel workers: " + std::to_string(Config.MaxParallelWorkers));
    Log.Info("Delete archives:  " + YesNo(Config.DeleteArchivesAfterProcess));
    Log.Info("Cleanup temp:     " + YesNo(Config.CleanupTempAfterProcess));
    if (Config.TestModeLimit > 0)
    {
        Log.Warning("Test mode limit:  " + std::to_string(Config.TestModeLimit));
    }
}

void ControlFlow::LogSummary(const BatchReport& Report)
{
    Log.Info("Summary: " + std::to_string(Report.Discovered) + " discovered, " + std::to_string(Report.Dispatched) + " dispatched in "
        + std::to_string(Report.Batches) + " batch(es)");

    for (const auto& Result : Report.Results)
    {
        if (Result.IsFailure())
        {
            Log.Error("  " + ItemStatusToString(Result.Status) + ": " + Result.ArchivePath.string() + " " + Result.FailureReason);
        }
    }
}
