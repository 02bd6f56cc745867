#include "BatchScheduler.hpp"
#include "ArchiveProcessor.hpp"
#include "FolderScanner.hpp"
#include "Logger.hpp"
#include "ThreadPool.hpp"

#include <algorithm>
#include <future>

namespace FS = std::filesystem;

size_t BatchReport::Count(ItemStatus Status) const
{
    return static_cast<size_t>(std::count_if(Results.begin(), Results.end(), [Status](const ItemResult& Result) { return Result.Status == Status; }));
}

bool BatchReport::HasFailures() const
{
    return std::any_of(Results.begin(), Results.end(), [](const ItemResult& Result) { return Result.IsFailure(); });
}

BatchScheduler::BatchScheduler(const RunConfig& Config)
    : Config(Config), Worker([&Config](const WorkItem& Item) { return ArchiveProcessor(Config).Process(Item); })
{
}

BatchScheduler::BatchScheduler(const RunConfig& Config, ItemWorker Worker) : Config(Config), Worker(std::move(Worker))
{
}

BatchReport BatchScheduler::Run()
{
    Log.Info("Scanning " + Config.RootFolder.string() + " for " + Config.ArchiveExtension + " files...");

    FolderScanner Scanner(Config);
    Scanner.Scan(Config.RootFolder);

    std::vector<FS::path> Archives = Scanner.GetArchives();
    std::sort(Archives.begin(), Archives.end());

    std::vector<WorkItem> Items;
    Items.reserve(Archives.size());
    for (const auto& ArchivePath : Archives)
    {
        Items.push_back(WorkItem::FromArchive(ArchivePath, Config));
    }

    return Dispatch(Items);
}

BatchReport BatchScheduler::Dispatch(const std::vector<WorkItem>& Items)
{
    BatchReport Report;
    Report.Discovered = Items.size();

    if (Items.empty())
    {
        Log.Warning("No archives to process.");
        return Report;
    }

    const size_t BatchLimit = std::max<size_t>(1, Config.MaxParallelWorkers);
    const size_t TestModeLimit = Config.TestModeLimit;

    Log.Info("Processing " + std::to_string(Items.size()) + " archive(s) with up to " + std::to_string(BatchLimit) + " parallel workers");

    ThreadPool Pool(BatchLimit);
    size_t Next = 0;

    while (Next < Items.size())
    {
        if (TestModeLimit > 0 && Report.Dispatched >= TestModeLimit)
        {
            Report.HaltedByTestMode = true;
            Log.Warning("Test mode: stopped after " + std::to_string(TestModeLimit) + " archive(s), "
                + std::to_string(Items.size() - Report.Dispatched) + " left unprocessed");
            break;
        }

        size_t BatchSize = std::min(BatchLimit, Items.size() - Next);
        if (TestModeLimit > 0)
        {
            BatchSize = std::min(BatchSize, TestModeLimit - Report.Dispatched);
        }

        ++Report.Batches;
        Log.Info("Starting batch " + std::to_string(Report.Batches) + " (" + std::to_string(BatchSize) + " archive(s))");

        std::vector<std::future<ItemResult>> Pending;
        Pending.reserve(BatchSize);
        for (size_t i = 0; i < BatchSize; ++i)
        {
            const WorkItem& Item = Items[Next + i];
            Pending.push_back(Pool.Submit([this, &Item]() { return RunWorker(Item); }));
        }
        Next += BatchSize;
        Report.Dispatched += BatchSize;

        // Barrier: the next batch starts only once every item of this one has finished.
        for (auto& Future : Pending)
        {
            Report.Results.push_back(Future.get());
        }
    }

    Report.NotDispatched = Items.size() - Report.Dispatched;

    Log.Info("Run complete: " + std::to_string(Report.Dispatched) + " dispatched, "
        + std::to_string(Report.Count(ItemStatus::Completed)) + " completed, "
        + std::to_string(Report.Count(ItemStatus::NoContent)) + " without content, "
        + std::to_string(Report.Count(ItemStatus::ExtractionFailed)) + " extraction failures, "
        + std::to_string(Report.Count(ItemStatus::MergeFailed)) + " merge failures, "
        + std::to_string(Report.Count(ItemStatus::Crashed)) + " crashed, "
        + std::to_string(Report.NotDispatched) + " not dispatched");
    return Report;
}

ItemResult BatchScheduler::RunWorker(const WorkItem& Item) const
{
    try
    {
        return Worker(Item);
    }
    catch (const std::exception& e)
    {
        Log.Error("[" + Item.AccountName + "] Worker failed: " + e.what());
        ItemResult Result;
        Result.ArchivePath = Item.ArchivePath;
        Result.Status = ItemStatus::Crashed;
        Result.FailureReason = e.what();
        return Result;
    }
    catch (...)
    {
        Log.Error("[" + Item.AccountName + "] Worker failed with an unknown exception");
        ItemResult Result;
        Result.ArchivePath = Item.ArchivePath;
        Result.Status = ItemStatus::Crashed;
        Result.FailureReason = "unknown exception";
        return Result;
    }
}
