#pragma once

#include <functional>
#include <vector>

#include "RunConfig.hpp"
#include "WorkItem.hpp"

struct BatchReport
{
    size_t Discovered = 0;
    size_t Dispatched = 0;
    size_t NotDispatched = 0;
    size_t Batches = 0;
    bool HaltedByTestMode = false;
    std::vector<ItemResult> Results;

    size_t Count(ItemStatus Status) const;
    bool HasFailures() const;
};

class BatchScheduler
{
public:
    using ItemWorker = std::function<ItemResult(const WorkItem&)>;

    // Uses ArchiveProcessor as the worker.
    explicit BatchScheduler(const RunConfig& Config);
    BatchScheduler(const RunConfig& Config, ItemWorker Worker);

    // Scans Config.RootFolder and dispatches everything found.
    // Throws std::filesystem::filesystem_error when the root folder cannot be scanned.
    BatchReport Run();

    // Dispatches Items in order, in barrier-synchronised batches of at most MaxParallelWorkers.
    BatchReport Dispatch(const std::vector<WorkItem>& Items);

private:
    const RunConfig& Config;
    ItemWorker Worker;

    ItemResult RunWorker(const WorkItem& Item) const;
};
