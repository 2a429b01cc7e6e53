#pragma once

#include <future>
#include <atomic>
#include <chrono>

/**
 * @brief Test helper that becomes ready once arrive() was called maxCount times.
 */
class Awaiter
{
  public:
    Awaiter(int maxCount = 1)
        : maxCount_(maxCount)
        , future_{promise_.get_future().share()}
    {}

    bool waitFor(std::chrono::milliseconds const& duration = std::chrono::seconds{1}) const
    {
        return future_.wait_for(duration) == std::future_status::ready;
    }

    void wait() const
    {
        future_.wait();
    }

    void arrive()
    {
        if (++counter_ == maxCount_)
            promise_.set_value();
    }

    int count() const
    {
        return counter_.load();
    }

  private:
    const int maxCount_{0};
    std::atomic_int counter_ = 0;
    std::promise<void> promise_{};
    std::shared_future<void> future_;
};
