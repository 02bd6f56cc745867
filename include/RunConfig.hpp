#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

enum class ProcessingMode
{
    Normal,
    ValidateOnly,
    ValidateAfter
};

std::optional<ProcessingMode> ToProcessingMode(const std::string& ModeStr);
std::string ProcessingModeToString(ProcessingMode Mode);

// Resolved once before the run starts and handed to every component by const reference.
struct RunConfig
{
    static constexpr unsigned int DefaultMaxParallelWorkers = 5;

    std::filesystem::path RootFolder;
    std::filesystem::path LogFile;

    unsigned int MaxRetries = 3;
    std::chrono::milliseconds RetryDelay{ 2000 };
    bool DeleteArchivesAfterProcess = false;
    unsigned int TestModeLimit = 0; // 0 = unlimited
    ProcessingMode Mode = ProcessingMode::Normal;
    unsigned int MaxParallelWorkers = DefaultMaxParallelWorkers;

    std::string ArchiveExtension = ".zip";
    std::string TempFolderName = "temp_takeout";
    std::string ContentFolderName = "Takeout";
    bool CleanupTempAfterProcess = true;
    bool FailOnItemErrors = false;
};
