#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>

class ThreadPool
{
public:
    explicit ThreadPool(size_t ThreadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Exceptions thrown by Job are delivered through the returned future.
    template <typename Callable>
    auto Submit(Callable&& Job) -> std::future<std::invoke_result_t<std::decay_t<Callable>&>>
    {
        using ResultType = std::invoke_result_t<std::decay_t<Callable>&>;

        auto Task = std::make_shared<std::packaged_task<ResultType()>>(std::forward<Callable>(Job));
        std::future<ResultType> Result = Task->get_future();
        {
            std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
            Jobs.push([Task]() { (*Task)(); });
        }
        ThreadPool_CV.notify_one();
        return Result;
    }

    size_t Size() const;

private:
    std::vector<std::thread> Workers;
    std::queue<std::function<void()>> Jobs;

    std::mutex ThreadPoolMutex;
    std::condition_variable ThreadPool_CV;
    bool ThreadPoolStop = false;

    void WorkerThread();
};
