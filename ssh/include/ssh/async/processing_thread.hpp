#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

namespace SecureShell
{
    class ProcessingStrand;

    /**
     * @brief Runs queued tasks one after another on a dedicated thread. A libssh session is not thread safe, so
     * every call touching one session, and every channel and file of it, goes through the same instance.
     */
    class ProcessingThread
    {
      public:
        /// Upper bound of tasks taken from the queue per wake up.
        constexpr static std::size_t maximumTasksProcessableAtOnce = 100;

        ProcessingThread();
        ~ProcessingThread();
        ProcessingThread(ProcessingThread const&) = delete;
        ProcessingThread& operator=(ProcessingThread const&) = delete;
        ProcessingThread(ProcessingThread&&) = delete;
        ProcessingThread& operator=(ProcessingThread&&) = delete;

        /**
         * @param waitCycleTimeout How long an idle thread sleeps before it looks at the stop flag again.
         */
        void start(std::chrono::milliseconds const& waitCycleTimeout = std::chrono::seconds{1});

        /**
         * @brief Joins the thread. Tasks still queued run on the calling thread, so no promise is left dangling.
         */
        void stop();

        bool isRunning() const;

        /**
         * @return false for an empty task or while stopping.
         */
        bool pushTask(std::function<void()> task);

        /**
         * @brief Queues func and hands its result out through a future. If the task cannot be queued the future
         * reports a broken promise.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            using ReturnType = std::invoke_result_t<std::decay_t<Func>>;
            auto promise = std::make_shared<std::promise<ReturnType>>();
            auto future = promise->get_future();
            pushTask([promise, func = std::forward<Func>(func)]() mutable {
                if constexpr (std::is_void_v<ReturnType>)
                {
                    func();
                    promise->set_value();
                }
                else
                {
                    promise->set_value(func());
                }
            });
            return future;
        }

        /**
         * @brief Blocks until the thread went through its queue once more.
         *
         * @return false on timeout or when the thread is not running.
         */
        bool awaitCycle(std::chrono::milliseconds maxWait = std::chrono::seconds{5});

        bool withinProcessingThread() const
        {
            return processingThreadId_.load() == std::this_thread::get_id();
        }

        std::unique_ptr<ProcessingStrand> createStrand();

      private:
        void run(std::chrono::milliseconds waitCycleTimeout);
        void drain();

      private:
        std::thread thread_{};
        mutable std::mutex taskMutex_{};
        std::condition_variable taskCondition_{};
        std::atomic_bool running_{false};
        std::atomic_bool shuttingDown_{false};
        std::atomic<std::thread::id> processingThreadId_{};
        std::deque<std::function<void()>> tasks_{};
    };
}
