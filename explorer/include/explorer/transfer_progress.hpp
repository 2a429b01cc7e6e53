#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace Explorer
{
    struct TransferProgress
    {
        std::uint64_t transferredBytes{0};
        std::uint64_t totalBytes{0};
        // Bytes per second.
        std::uint64_t speed{0};
    };

    using ProgressCallback = std::function<void(TransferProgress const&)>;

    /**
     * @brief Throttles progress reports and measures speed. Not thread safe.
     */
    class ProgressMeter
    {
      public:
        using Clock = std::chrono::steady_clock;

        /**
         * @param interval Minimum time between two reports.
         * @param smoothing Weight of the newest sample in the moving average, 1 disables smoothing.
         */
        explicit ProgressMeter(std::chrono::milliseconds interval, double smoothing = 1.0, Clock::time_point now = Clock::now());

        /**
         * @brief Returns the current speed if a report is due.
         */
        std::optional<std::uint64_t> sample(std::uint64_t transferred, Clock::time_point now = Clock::now());

        /**
         * @brief Forgets the time spent paused, so the speed does not drop towards zero after a resume.
         */
        void rebase(std::uint64_t transferred, Clock::time_point now = Clock::now());

        std::uint64_t speed() const noexcept
        {
            return speed_ ? static_cast<std::uint64_t>(*speed_) : 0;
        }

      private:
        std::chrono::milliseconds interval_;
        double smoothing_;
        Clock::time_point lastTime_;
        std::uint64_t lastBytes_;
        std::optional<double> speed_;
    };
}
