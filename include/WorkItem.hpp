#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "RunConfig.hpp"

// One archive and the paths derived from it. The temp root lives inside the
// account folder, so no two items share one.
struct WorkItem
{
    std::filesystem::path ArchivePath;
    std::filesystem::path AccountFolder;
    std::string AccountName;
    std::filesystem::path TempRoot;
    std::filesystem::path ContentFolder;

    static WorkItem FromArchive(const std::filesystem::path& ArchivePath, const RunConfig& Config);
};

enum class ItemStatus
{
    Completed,
    NoContent,
    ExtractionFailed,
    MergeFailed,
    Crashed
};

std::string ItemStatusToString(ItemStatus Status);

struct ItemResult
{
    std::filesystem::path ArchivePath;
    ItemStatus Status = ItemStatus::Completed;

    size_t Moved = 0;
    size_t Skipped = 0;
    size_t Validated = 0;
    size_t Failed = 0;

    bool ArchiveDeleted = false;
    std::string FailureReason;

    bool IsFailure() const;
};
