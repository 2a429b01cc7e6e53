#pragma once

#include <ssh/async/processing_thread.hpp>

#include <future>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace SecureShell
{
    /**
     * @brief Shares a processing thread but refuses tasks after it has been finalized.
     * Finalization means a close operation is happening, e.g. no more file reads once the sftp channel closes.
     */
    class ProcessingStrand
    {
      public:
        explicit ProcessingStrand(ProcessingThread* processingThread)
            : processingThread_(processingThread)
        {}

        /**
         * @brief Pushes a task unless the strand was finalized.
         *
         * @return true If the task was pushed.
         */
        bool pushTask(std::function<void()> task)
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return false;
            return processingThread_->pushTask(std::move(task));
        }

        /**
         * @brief Pushes a task whose result is returned through a future.
         * A finalized strand yields a future holding an exception.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return rejected<std::invoke_result_t<std::decay_t<Func>>>();
            return processingThread_->pushPromiseTask(std::forward<Func>(func));
        }

        /**
         * @brief Pushes the last task of this strand. Every later push is rejected.
         */
        template <typename FunctionT>
        auto pushFinalPromiseTask(FunctionT&& func) -> std::future<std::invoke_result_t<std::decay_t<FunctionT>>>
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return rejected<std::invoke_result_t<std::decay_t<FunctionT>>>();
            finalized_ = true;
            return processingThread_->pushPromiseTask(std::forward<FunctionT>(func));
        }

        bool withinProcessingThread() const noexcept
        {
            return processingThread_->withinProcessingThread();
        }

        bool isFinalized() const noexcept
        {
            std::scoped_lock lock(mutex_);
            return finalized_;
        }

      private:
        template <typename T>
        static std::future<T> rejected()
        {
            std::promise<T> promise{};
            promise.set_exception(std::make_exception_ptr(std::runtime_error("Cannot push task to finalized strand.")));
            return promise.get_future();
        }

      private:
        mutable std::recursive_mutex mutex_{};
        bool finalized_ = false;
        ProcessingThread* processingThread_{};
    };
}
