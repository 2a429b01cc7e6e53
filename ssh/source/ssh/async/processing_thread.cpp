#include <ssh/async/processing_thread.hpp>
#include <ssh/async/processing_strand.hpp>

#include <log/log.hpp>

#include <exception>
#include <vector>

namespace SecureShell
{
    ProcessingThread::ProcessingThread() = default;
    ProcessingThread::~ProcessingThread()
    {
        stop();
    }
    bool ProcessingThread::isRunning() const
    {
        return running_;
    }
    void ProcessingThread::start(std::chrono::milliseconds const& waitCycleTimeout)
    {
        if (running_.exchange(true))
            return;

        shuttingDown_ = false;
        std::promise<void> awaitThreadStart{};
        auto started = awaitThreadStart.get_future();
        thread_ = std::thread([this, &awaitThreadStart, waitCycleTimeout] {
            processingThreadId_.store(std::this_thread::get_id());
            awaitThreadStart.set_value();
            run(waitCycleTimeout);
        });
        started.wait();
    }
    void ProcessingThread::stop()
    {
        shuttingDown_ = true;
        {
            std::lock_guard lock{taskMutex_};
            running_ = false;
        }
        taskCondition_.notify_all();
        if (thread_.joinable())
            thread_.join();
        processingThreadId_.store(std::thread::id{});

        // Whatever was queued while the thread wound down still runs.
        drain();
        shuttingDown_ = false;
    }
    void ProcessingThread::drain()
    {
        std::deque<std::function<void()>> remaining{};
        {
            std::lock_guard lock{taskMutex_};
            remaining.swap(tasks_);
        }
        for (auto& task : remaining)
            task();
    }
    bool ProcessingThread::pushTask(std::function<void()> task)
    {
        if (!task || shuttingDown_)
            return false;

        {
            std::lock_guard lock{taskMutex_};
            tasks_.push_back(std::move(task));
        }
        taskCondition_.notify_one();
        return true;
    }
    std::unique_ptr<ProcessingStrand> ProcessingThread::createStrand()
    {
        return std::make_unique<ProcessingStrand>(this);
    }
    void ProcessingThread::run(std::chrono::milliseconds waitCycleTimeout)
    {
        while (running_)
        {
            std::vector<std::function<void()>> batch{};
            {
                std::unique_lock lock{taskMutex_};
                taskCondition_.wait_for(lock, waitCycleTimeout, [this] {
                    return !tasks_.empty() || !running_;
                });

                const auto count = std::min(tasks_.size(), maximumTasksProcessableAtOnce);
                batch.reserve(count);
                std::move(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count), std::back_inserter(batch));
                tasks_.erase(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count));
            }

            for (auto& task : batch)
            {
                try
                {
                    task();
                }
                catch (std::exception const& exc)
                {
                    Log::error("ProcessingThread: Task threw: {}", exc.what());
                }
            }
        }
    }
    bool ProcessingThread::awaitCycle(std::chrono::milliseconds maxWait)
    {
        if (withinProcessingThread() || !running_)
            return false;

        return pushPromiseTask([]() {
                   return true;
               }).wait_for(maxWait) == std::future_status::ready;
    }
}
