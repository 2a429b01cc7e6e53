#pragma once

#include <ssh/async/processing_thread.hpp>
#include <ssh/channel_source_interface.hpp>
#include <ssh/sftp_error.hpp>

#include <libssh/libsshpp.hpp>

#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace SecureShell
{
    class SftpSession;

    /**
     * @brief Owns one ssh connection and hands out sftp channels over it.
     * Connecting and authenticating is done by the caller through the ssh::Session before start().
     */
    class Session : public ISftpChannelSource
    {
      public:
        Session();
        ~Session() override;
        Session(Session const&) = delete;
        Session& operator=(Session const&) = delete;
        Session(Session&&) = delete;
        Session& operator=(Session&&) = delete;

        operator ssh::Session&()
        {
            return session_;
        }

        /**
         * @brief Starts the processing thread that runs all libssh calls of this session.
         */
        void start();

        /**
         * @brief Stops processing but does not close the sftp channels.
         */
        void stop();

        bool isRunning() const;

        /**
         * @brief Opens a new sftp channel. Channels stay usable until they are released or the session is destroyed.
         */
        std::future<std::expected<std::shared_ptr<ISftpClient>, SftpError>> openSftpChannel() override;

      private:
        /**
         * @brief Closes all channels and disconnects. The session is not usable after this.
         */
        void shutdown();

      private:
        SecureShell::ProcessingThread processingThread_;
        ssh::Session session_;
        std::mutex sftpSessionGuard_;
        std::vector<std::weak_ptr<SftpSession>> sftpSessions_;
    };
}
