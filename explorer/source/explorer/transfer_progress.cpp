#include <explorer/transfer_progress.hpp>

#include <algorithm>

namespace Explorer
{
    ProgressMeter::ProgressMeter(std::chrono::milliseconds interval, double smoothing, Clock::time_point now)
        : interval_{interval}
        , smoothing_{std::clamp(smoothing, 0.01, 1.0)}
        , lastTime_{now}
        , lastBytes_{0}
        , speed_{std::nullopt}
    {}

    std::optional<std::uint64_t> ProgressMeter::sample(std::uint64_t transferred, Clock::time_point now)
    {
        const auto elapsed = now - lastTime_;
        if (elapsed < interval_ || elapsed <= Clock::duration::zero())
            return std::nullopt;

        const auto seconds = std::chrono::duration<double>(elapsed).count();
        const auto delta = transferred >= lastBytes_ ? transferred - lastBytes_ : 0;
        const auto current = static_cast<double>(delta) / seconds;

        if (speed_)
            speed_ = smoothing_ * current + (1.0 - smoothing_) * *speed_;
        else
            speed_ = current;

        lastTime_ = now;
        lastBytes_ = transferred;
        return speed();
    }

    void ProgressMeter::rebase(std::uint64_t transferred, Clock::time_point now)
    {
        lastTime_ = now;
        lastBytes_ = transferred;
    }
}
