#include "ArchiveProcessor.hpp"
#include "ArchiveExtractor.hpp"
#include "ContentComparator.hpp"
#include "FileRelocator.hpp"
#include "Logger.hpp"
#include "RetryExecutor.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    std::string ToLower(std::string Input)
    {
        std::transform(Input.begin(), Input.end(), Input.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Input;
    }

    std::string ModePrefix(ProcessingMode Mode)
    {
        switch (Mode)
        {
        case ProcessingMode::ValidateOnly:  return "[Validate-Only] ";
        case ProcessingMode::ValidateAfter: return "[Validate-After] ";
        default:                            return "[Merge] ";
        }
    }
}

ArchiveProcessor::ArchiveProcessor(const RunConfig& Config) : Config(Config)
{
}

std::string ArchiveProcessor::Tag(const WorkItem& Item) const
{
    return "[" + Item.AccountName + "] ";
}

ItemResult ArchiveProcessor::Process(const WorkItem& Item) const
{
    ItemResult Result;
    Result.ArchivePath = Item.ArchivePath;

    Log.Info(Tag(Item) + "Processing " + Item.ArchivePath.string());

    try
    {
        RunStateMachine(Item, Result);
    }
    catch (const std::exception& e)
    {
        Result.Status = ItemStatus::Crashed;
        Result.FailureReason = e.what();
    }
    catch (...)
    {
        Result.Status = ItemStatus::Crashed;
        Result.FailureReason = "unknown exception";
    }

    const std::string Counts = "moved " + std::to_string(Result.Moved) + ", skipped " + std::to_string(Result.Skipped)
        + ", validated " + std::to_string(Result.Validated) + ", failed " + std::to_string(Result.Failed);

    switch (Result.Status)
    {
    case ItemStatus::Completed:
        Log.Success(Tag(Item) + "Completed " + Item.ArchivePath.filename().string() + " (" + Counts + ")");
        break;
    case ItemStatus::NoContent:
        Log.Warning(Tag(Item) + "Completed " + Item.ArchivePath.filename().string() + " with nothing to merge");
        break;
    default:
        Log.Error(Tag(Item) + ItemStatusToString(Result.Status) + ": " + Item.ArchivePath.string() + " (" + Counts + ") " + Result.FailureReason);
        break;
    }
    return Result;
}

void ArchiveProcessor::RunStateMachine(const WorkItem& Item, ItemResult& Result) const
{
    if (!CleanTemp(Item, Result) || !Extract(Item, Result))
    {
        Result.Status = ItemStatus::ExtractionFailed;
        return;
    }

    const std::optional<FS::path> ContentFolder = ResolveContentFolder(Item);
    if (!ContentFolder)
    {
        Log.Warning(Tag(Item) + "No '" + Config.ContentFolderName + "' folder found in " + Item.TempRoot.string() + ", nothing to merge");
        Result.Status = ItemStatus::NoContent;
    }
    else
    {
        Merge(Item, *ContentFolder, Result);
        Result.Status = (Result.Failed > 0) ? ItemStatus::MergeFailed : ItemStatus::Completed;
    }

    PostProcess(Item, Result);
}

bool ArchiveProcessor::CleanTemp(const WorkItem& Item, ItemResult& Result) const
{
    if (!FS::exists(FS::symlink_status(Item.TempRoot)))
    {
        return true;
    }

    Log.Info(Tag(Item) + "Removing previous extraction folder " + Item.TempRoot.string());
    auto Outcome = RetryExecutor::Execute("Remove " + Item.TempRoot.string(), [&Item]() { FS::remove_all(Item.TempRoot); },
                                          Config.MaxRetries, Config.RetryDelay);
    if (!Outcome.Success)
    {
        Result.FailureReason = "Could not clean " + Item.TempRoot.string() + ": " + Outcome.LastError;
        return false;
    }
    return true;
}

bool ArchiveProcessor::Extract(const WorkItem& Item, ItemResult& Result) const
{
    auto Outcome = RetryExecutor::Execute("Extract " + Item.ArchivePath.string(), [&Item]()
    {
        // Start every attempt from an empty folder so a failed attempt leaves nothing behind.
        FS::remove_all(Item.TempRoot);
        return ArchiveExtractor::ExtractAll(Item.ArchivePath, Item.TempRoot);
    }, Config.MaxRetries, Config.RetryDelay);

    if (!Outcome.Success)
    {
        Result.FailureReason = "Extraction failed: " + Outcome.LastError;
        return false;
    }

    Log.Info(Tag(Item) + "Extracted " + std::to_string(*Outcome.Value) + " entries into " + Item.TempRoot.string());
    return true;
}

std::optional<FS::path> ArchiveProcessor::ResolveContentFolder(const WorkItem& Item) const
{
    if (FS::is_directory(Item.ContentFolder))
    {
        return Item.ContentFolder;
    }

    const std::string Wanted = ToLower(Config.ContentFolderName);
    for (const auto& Entry : FS::directory_iterator(Item.TempRoot))
    {
        if (Entry.is_directory() && ToLower(Entry.path().filename().string()) == Wanted)
        {
            return Entry.path();
        }
    }
    return std::nullopt;
}

void ArchiveProcessor::Merge(const WorkItem& Item, const FS::path& ContentFolder, ItemResult& Result) const
{
    std::vector<FS::path> Entries;
    for (const auto& Entry : FS::directory_iterator(ContentFolder))
    {
        Entries.push_back(Entry.path());
    }
    std::sort(Entries.begin(), Entries.end());

    Log.Info(Tag(Item) + "Merging " + std::to_string(Entries.size()) + " entries from " + ContentFolder.string()
        + " into " + Item.AccountFolder.string() + " (mode: " + ProcessingModeToString(Config.Mode) + ")");

    for (const auto& SourcePath : Entries)
    {
        MergeEntry(SourcePath, Item.AccountFolder / SourcePath.filename(), Result);
    }
}

void ArchiveProcessor::MergeEntry(const FS::path& SourcePath, const FS::path& DestPath, ItemResult& Result) const
{
    const std::string Prefix = ModePrefix(Config.Mode);

    if (Config.Mode == ProcessingMode::ValidateOnly)
    {
        Log.Info(Prefix + "Skipped, validation only: " + SourcePath.filename().string() + " → " + DestPath.string());
        ++Result.Validated;
        return;
    }

    const ProcessingMode Mode = Config.Mode;
    auto Outcome = RetryExecutor::Execute("Merge " + SourcePath.string(), [Mode, &SourcePath, &DestPath]()
    {
        if (!ContentComparator::ShouldOverwrite(SourcePath, DestPath))
        {
            return MergeAction::SkippedNoChange;
        }
        if (Mode == ProcessingMode::ValidateAfter)
        {
            return MergeAction::WouldValidate;
        }
        return FileRelocator::Relocate(SourcePath, DestPath) ? MergeAction::Moved : MergeAction::SkippedExisting;
    }, Config.MaxRetries, Config.RetryDelay);

    if (!Outcome.Success)
    {
        ++Result.Failed;
        Result.FailureReason = "Last merge failure: " + Outcome.LastError;
        return;
    }

    switch (*Outcome.Value)
    {
    case MergeAction::Moved:
        ++Result.Moved;
        break;
    case MergeAction::SkippedExisting:
        ++Result.Skipped;
        break;
    case MergeAction::SkippedNoChange:
        Log.Info(Prefix + "Skipped, no change: " + DestPath.string());
        ++Result.Skipped;
        break;
    case MergeAction::WouldValidate:
        Log.Info(Prefix + "Would validate: " + SourcePath.string() + " → " + DestPath.string());
        ++Result.Validated;
        break;
    }
}

void ArchiveProcessor::PostProcess(const WorkItem& Item, ItemResult& Result) const
{
    if (Config.Mode != ProcessingMode::Normal)
    {
        Log.Info(Tag(Item) + "Extraction folder kept for inspection: " + Item.TempRoot.string());
        return;
    }

    if (Config.CleanupTempAfterProcess && !Result.IsFailure())
    {
        auto Outcome = RetryExecutor::Execute("Remove " + Item.TempRoot.string(), [&Item]() { FS::remove_all(Item.TempRoot); },
                                              Config.MaxRetries, Config.RetryDelay);
        if (!Outcome.Success)
        {
            Log.Warning(Tag(Item) + "Extraction folder left behind, it is removed on the next run: " + Item.TempRoot.string());
        }
    }

    // An archive without content was never merged anywhere, so it is kept.
    if (Config.DeleteArchivesAfterProcess && Result.Status == ItemStatus::Completed)
    {
        auto Outcome = RetryExecutor::Execute("Delete " + Item.ArchivePath.string(), [&Item]() { return FS::remove(Item.ArchivePath); },
                                              Config.MaxRetries, Config.RetryDelay);
        if (Outcome.Success)
        {
            Result.ArchiveDeleted = *Outcome.Value;
            Log.Info(Tag(Item) + "Deleted archive " + Item.ArchivePath.string());
        }
        else
        {
            Log.Warning(Tag(Item) + "Archive could not be deleted: " + Item.ArchivePath.string());
        }
    }
}
