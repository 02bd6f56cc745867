#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "BatchScheduler.hpp"
#include "TestSupport.hpp"

namespace FS = std::filesystem;
using namespace TestSupport;

namespace
{
    std::vector<WorkItem> MakeItems(const RunConfig& Config, size_t Count)
    {
        std::vector<WorkItem> Items;
        for (size_t i = 0; i < Count; ++i)
        {
            Items.push_back(WorkItem::FromArchive(Config.RootFolder / ("account" + std::to_string(i)) / "export.zip", Config));
        }
        return Items;
    }

    ItemResult Done(const WorkItem& Item)
    {
        ItemResult Result;
        Result.ArchivePath = Item.ArchivePath;
        return Result;
    }
}

class BatchSchedulerTest : public ::testing::Test
{
protected:
    TempDir Scratch;
    ScopedTestLog TestLog{ Scratch.Path() / "batch.log" };
    RunConfig Config = MakeConfig(Scratch.Path() / "root");
};

TEST_F(BatchSchedulerTest, NeverRunsMoreThanTheConcurrencyCap)
{
    std::atomic<int> Active{ 0 };
    std::atomic<int> Peak{ 0 };

    BatchScheduler Scheduler(Config, [&](const WorkItem& Item)
    {
        const int Now = ++Active;
        int Seen = Peak.load();
        while (Now > Seen && !Peak.compare_exchange_weak(Seen, Now))
        {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --Active;
        return Done(Item);
    });

    const BatchReport Report = Scheduler.Dispatch(MakeItems(Config, 17));

    EXPECT_LE(Peak.load(), static_cast<int>(RunConfig::DefaultMaxParallelWorkers));
    EXPECT_EQ(Report.Dispatched, 17u);
    EXPECT_EQ(Report.Results.size(), 17u);
    EXPECT_EQ(Report.Batches, 4u);
}

TEST_F(BatchSchedulerTest, BatchesAreSeparatedByABarrier)
{
    std::mutex EventMutex;
    std::vector<std::pair<size_t, bool>> Events; // (item index, started?)
    const std::vector<WorkItem> Items = MakeItems(Config, 7);

    BatchScheduler Scheduler(Config, [&](const WorkItem& Item)
    {
        const size_t Index = static_cast<size_t>(std::find_if(Items.begin(), Items.end(), [&Item](const WorkItem& Candidate) { return Candidate.ArchivePath == Item.ArchivePath; }) - Items.begin());
        {
            std::lock_guard<std::mutex> Lock(EventMutex);
            Events.emplace_back(Index, true);
        }
        // The first item of the first batch is slow; nothing from the second batch may start before it ends.
        std::this_thread::sleep_for(std::chrono::milliseconds(Index == 0 ? 80 : 5));
        {
            std::lock_guard<std::mutex> Lock(EventMutex);
            Events.emplace_back(Index, false);
        }
        return Done(Item);
    });

    const BatchReport Report = Scheduler.Dispatch(Items);
    ASSERT_EQ(Report.Batches, 2u);

    const auto SlowEnd = std::find(Events.begin(), Events.end(), std::make_pair(size_t{ 0 }, false));
    ASSERT_NE(SlowEnd, Events.end());
    for (auto It = Events.begin(); It != SlowEnd; ++It)
    {
        EXPECT_LT(It->first, 5u) << "item " << It->first << " ran before the first batch finished";
    }
}

TEST_F(BatchSchedulerTest, TestModeCapLimitsDispatch)
{
    Config.TestModeLimit = 7;
    std::atomic<int> Calls{ 0 };

    BatchScheduler Scheduler(Config, [&](const WorkItem& Item)
    {
        ++Calls;
        return Done(Item);
    });

    const BatchReport Report = Scheduler.Dispatch(MakeItems(Config, 12));

    EXPECT_EQ(Calls.load(), 7);
    EXPECT_EQ(Report.Dispatched, 7u);
    EXPECT_EQ(Report.NotDispatched, 5u);
    EXPECT_TRUE(Report.HaltedByTestMode);
    EXPECT_NE(TestLog.Contents().find("Test mode: stopped after 7 archive(s)"), std::string::npos);
}

TEST_F(BatchSchedulerTest, TestModeCapAboveItemCountDispatchesEverything)
{
    Config.TestModeLimit = 50;
    BatchScheduler Scheduler(Config, [](const WorkItem& Item) { return Done(Item); });

    const BatchReport Report = Scheduler.Dispatch(MakeItems(Config, 3));

    EXPECT_EQ(Report.Dispatched, 3u);
    EXPECT_FALSE(Report.HaltedByTestMode);
}

TEST_F(BatchSchedulerTest, ThrowingWorkerIsIsolated)
{
    BatchScheduler Scheduler(Config, [](const WorkItem& Item)
    {
        if (Item.AccountName == "account1")
        {
            throw std::runtime_error("boom");
        }
        return Done(Item);
    });

    const BatchReport Report = Scheduler.Dispatch(MakeItems(Config, 3));

    EXPECT_EQ(Report.Results.size(), 3u);
    EXPECT_EQ(Report.Count(ItemStatus::Crashed), 1u);
    EXPECT_EQ(Report.Count(ItemStatus::Completed), 2u);
    EXPECT_TRUE(Report.HasFailures());
}

TEST_F(BatchSchedulerTest, NonStandardThrowIsReportedAsCrash)
{
    BatchScheduler Scheduler(Config, [](const WorkItem& Item) -> ItemResult
    {
        if (Item.AccountName == "account0")
        {
            throw 42;
        }
        return Done(Item);
    });

    const BatchReport Report = Scheduler.Dispatch(MakeItems(Config, 2));

    ASSERT_EQ(Report.Results.size(), 2u);
    EXPECT_EQ(Report.Results[0].Status, ItemStatus::Crashed);
    EXPECT_EQ(Report.Results[0].FailureReason, "unknown exception");
    EXPECT_EQ(Report.Results[1].Status, ItemStatus::Completed);
}

TEST_F(BatchSchedulerTest, NothingDiscoveredDispatchesNothing)
{
    FS::create_directories(Config.RootFolder);
    bool Called = false;
    BatchScheduler Scheduler(Config, [&Called](const WorkItem& Item)
    {
        Called = true;
        return Done(Item);
    });

    const BatchReport Report = Scheduler.Run();

    EXPECT_FALSE(Called);
    EXPECT_EQ(Report.Discovered, 0u);
    EXPECT_EQ(Report.Batches, 0u);
    EXPECT_NE(TestLog.Contents().find("No archives to process."), std::string::npos);
}

TEST_F(BatchSchedulerTest, MissingRootFolderThrows)
{
    BatchScheduler Scheduler(Config);
    EXPECT_THROW(Scheduler.Run(), FS::filesystem_error);
}

TEST_F(BatchSchedulerTest, NormalRunMergesEveryAccount)
{
    MakeZip(Config.RootFolder / "A/export.zip", { { "takeout/notes.txt", "notes of A" } });
    MakeZip(Config.RootFolder / "B/export.zip", { { "takeout/notes.txt", "notes of B" } });

    const BatchReport Report = BatchScheduler(Config).Run();

    EXPECT_EQ(Report.Count(ItemStatus::Completed), 2u);
    EXPECT_EQ(ReadFile(Config.RootFolder / "A/notes.txt"), "notes of A");
    EXPECT_EQ(ReadFile(Config.RootFolder / "B/notes.txt"), "notes of B");
    EXPECT_FALSE(FS::exists(Config.RootFolder / "A/temp_takeout"));
    EXPECT_FALSE(FS::exists(Config.RootFolder / "B/temp_takeout"));
}

TEST_F(BatchSchedulerTest, ValidateOnlyRunCreatesNothing)
{
    Config.Mode = ProcessingMode::ValidateOnly;
    MakeZip(Config.RootFolder / "A/export.zip", { { "takeout/notes.txt", "notes of A" } });
    MakeZip(Config.RootFolder / "B/export.zip", { { "takeout/notes.txt", "notes of B" } });

    const BatchReport Report = BatchScheduler(Config).Run();

    EXPECT_EQ(Report.Dispatched, 2u);
    EXPECT_FALSE(FS::exists(Config.RootFolder / "A/notes.txt"));
    EXPECT_FALSE(FS::exists(Config.RootFolder / "B/notes.txt"));

    const std::string Contents = TestLog.Contents();
    const std::string Skip = "[Validate-Only] Skipped, validation only: notes.txt";
    EXPECT_NE(Contents.find(Skip + " → " + (Config.RootFolder / "A/notes.txt").string()), std::string::npos);
    EXPECT_NE(Contents.find(Skip + " → " + (Config.RootFolder / "B/notes.txt").string()), std::string::npos);
}

TEST_F(BatchSchedulerTest, FailedArchiveDoesNotStopTheRun)
{
    WriteFile(Config.RootFolder / "A/export.zip", "not an archive");
    MakeZip(Config.RootFolder / "B/export.zip", { { "Takeout/notes.txt", "notes of B" } });

    const BatchReport Report = BatchScheduler(Config).Run();

    EXPECT_EQ(Report.Dispatched, 2u);
    EXPECT_EQ(Report.Count(ItemStatus::ExtractionFailed), 1u);
    EXPECT_EQ(Report.Count(ItemStatus::Completed), 1u);
    EXPECT_FALSE(FS::exists(Config.RootFolder / "A/notes.txt"));
    EXPECT_EQ(ReadFile(Config.RootFolder / "B/notes.txt"), "notes of B");
}
