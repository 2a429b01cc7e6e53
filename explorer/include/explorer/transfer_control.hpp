#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace Explorer
{
    /**
     * @brief Shared between the ui side of a transfer and its worker threads. Workers poll isCancelled and call
     * waitWhilePaused between chunks.
     */
    class TransferControl
    {
      public:
        TransferControl() = default;
        TransferControl(TransferControl const&) = delete;
        TransferControl& operator=(TransferControl const&) = delete;
        TransferControl(TransferControl&&) = delete;
        TransferControl& operator=(TransferControl&&) = delete;
        ~TransferControl() = default;

        /**
         * @brief Sticky. Also releases everyone blocked in waitWhilePaused.
         *
         * @return false once the transfer has committed its result, cancelling is too late then.
         */
        bool cancel();
        bool isCancelled() const noexcept;

        /**
         * @brief Called by the transfer right before it publishes its result (the final rename of a download).
         * Cancel and commit exclude each other, whichever comes first wins.
         *
         * @return false if the transfer was cancelled before.
         */
        bool commit();

        void pause();
        void resume();
        bool isPaused() const;

        /**
         * @brief Blocks while paused.
         *
         * @return true if the caller had to wait, the caller should restart its speed measurement then.
         */
        bool waitWhilePaused();

      private:
        mutable std::mutex mutex_{};
        std::condition_variable condition_{};
        bool paused_{false};
        bool committed_{false};
        std::atomic_bool cancelled_{false};
    };
}
