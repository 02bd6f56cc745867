#include "ThreadPool.hpp"

ThreadPool::ThreadPool(size_t ThreadCount)
{
    if (ThreadCount == 0)
    {
        ThreadCount = 1;
    }
    for (size_t i = 0; i < ThreadCount; ++i)
    {
        Workers.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
        ThreadPoolStop = true;
    }
    ThreadPool_CV.notify_all();
    for (std::thread& Worker : Workers)
    {
        if (Worker.joinable())
        {
            Worker.join();
        }
    }
}

size_t ThreadPool::Size() const
{
    return Workers.size();
}

void ThreadPool::WorkerThread()
{
    while (true)
    {
        std::function<void()> Job;
        {
            std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
            ThreadPool_CV.wait(Lock, [this] { return ThreadPoolStop || !Jobs.empty(); });
            if (ThreadPoolStop && Jobs.empty())
            {
                return;
            }
            Job = std::move(Jobs.front());
            Jobs.pop();
        }
        Job();
    }
}
