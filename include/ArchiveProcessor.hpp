#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "RunConfig.hpp"
#include "WorkItem.hpp"

// Runs one archive through CleanTemp -> Extract -> Merge -> PostProcess.
class ArchiveProcessor
{
public:
    explicit ArchiveProcessor(const RunConfig& Config);

    // Worker boundary: never throws, every failure ends up in the returned result.
    ItemResult Process(const WorkItem& Item) const;

private:
    enum class MergeAction
    {
        Moved,
        SkippedExisting,
        SkippedNoChange,
        WouldValidate
    };

    const RunConfig& Config;

    void RunStateMachine(const WorkItem& Item, ItemResult& Result) const;

    bool CleanTemp(const WorkItem& Item, ItemResult& Result) const;
    bool Extract(const WorkItem& Item, ItemResult& Result) const;
    void Merge(const WorkItem& Item, const std::filesystem::path& ContentFolder, ItemResult& Result) const;
    void MergeEntry(const std::filesystem::path& SourcePath, const std::filesystem::path& DestPath, ItemResult& Result) const;
    void PostProcess(const WorkItem& Item, ItemResult& Result) const;

    std::optional<std::filesystem::path> ResolveContentFolder(const WorkItem& Item) const;
    std::string Tag(const WorkItem& Item) const;
};
