#pragma once

#include <explorer/transfer_progress.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace Explorer
{
    /**
     * @brief Sums the progress of several workers. add is lock free, at most one worker at a time emits a report.
     */
    class ProgressAccumulator
    {
      public:
        ProgressAccumulator(
            std::uint64_t totalBytes,
            std::size_t workerCount,
            std::chrono::milliseconds interval,
            ProgressCallback onProgress);

        void add(std::size_t worker, std::uint64_t bytes);

        std::uint64_t transferred() const noexcept;
        std::uint64_t transferredBy(std::size_t worker) const;
        std::size_t workerCount() const noexcept
        {
            return workerCount_;
        }

        /**
         * @brief Restarts the speed measurement after a pause.
         */
        void rebase();

        /**
         * @brief Emits a report regardless of the interval.
         */
        void flush();

      private:
        std::uint64_t totalBytes_;
        std::size_t workerCount_;
        std::atomic<std::uint64_t> transferred_;
        std::unique_ptr<std::atomic<std::uint64_t>[]> perWorker_;
        std::mutex reportGuard_;
        ProgressMeter meter_;
        ProgressCallback onProgress_;
    };
}
