#include <explorer/transfer_control.hpp>

namespace Explorer
{
    bool TransferControl::cancel()
    {
        {
            std::scoped_lock lock{mutex_};
            if (committed_)
                return false;
            cancelled_ = true;
        }
        condition_.notify_all();
        return true;
    }

    bool TransferControl::commit()
    {
        std::scoped_lock lock{mutex_};
        if (cancelled_)
            return false;
        committed_ = true;
        return true;
    }

    bool TransferControl::isCancelled() const noexcept
    {
        return cancelled_.load();
    }

    void TransferControl::pause()
    {
        std::scoped_lock lock{mutex_};
        paused_ = true;
    }

    void TransferControl::resume()
    {
        {
            std::scoped_lock lock{mutex_};
            paused_ = false;
        }
        condition_.notify_all();
    }

    bool TransferControl::isPaused() const
    {
        std::scoped_lock lock{mutex_};
        return paused_;
    }

    bool TransferControl::waitWhilePaused()
    {
        std::unique_lock lock{mutex_};
        if (!paused_ || cancelled_)
            return false;
        condition_.wait(lock, [this]() {
            return !paused_ || cancelled_;
        });
        return true;
    }
}
