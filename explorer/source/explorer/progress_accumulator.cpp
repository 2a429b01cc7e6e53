#include <explorer/progress_accumulator.hpp>

#include <stdexcept>

namespace Explorer
{
    namespace
    {
        constexpr double speedSmoothing = 0.3;
    }

    ProgressAccumulator::ProgressAccumulator(
        std::uint64_t totalBytes,
        std::size_t workerCount,
        std::chrono::milliseconds interval,
        ProgressCallback onProgress)
        : totalBytes_{totalBytes}
        , workerCount_{workerCount}
        , transferred_{0}
        , perWorker_{std::make_unique<std::atomic<std::uint64_t>[]>(workerCount)}
        , reportGuard_{}
        , meter_{interval, speedSmoothing}
        , onProgress_{std::move(onProgress)}
    {}

    void ProgressAccumulator::add(std::size_t worker, std::uint64_t bytes)
    {
        perWorker_[worker].fetch_add(bytes);
        transferred_.fetch_add(bytes);

        std::unique_lock lock{reportGuard_, std::try_to_lock};
        if (!lock.owns_lock())
            return;
        const auto total = transferred_.load();
        if (auto speed = meter_.sample(total); speed && onProgress_)
            onProgress_(TransferProgress{.transferredBytes = total, .totalBytes = totalBytes_, .speed = *speed});
    }

    std::uint64_t ProgressAccumulator::transferred() const noexcept
    {
        return transferred_.load();
    }

    std::uint64_t ProgressAccumulator::transferredBy(std::size_t worker) const
    {
        if (worker >= workerCount_)
            throw std::out_of_range("worker index out of range");
        return perWorker_[worker].load();
    }

    void ProgressAccumulator::rebase()
    {
        std::scoped_lock lock{reportGuard_};
        meter_.rebase(transferred_.load());
    }

    void ProgressAccumulator::flush()
    {
        std::scoped_lock lock{reportGuard_};
        if (onProgress_)
        {
            onProgress_(TransferProgress{
                .transferredBytes = transferred_.load(), .totalBytes = totalBytes_, .speed = meter_.speed()});
        }
    }
}
