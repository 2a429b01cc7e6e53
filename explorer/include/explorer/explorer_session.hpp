#pragma once

#include <explorer/executors.hpp>
#include <explorer/file_operations.hpp>
#include <explorer/navigation_engine.hpp>
#include <explorer/notification.hpp>
#include <explorer/transfer_manager.hpp>
#include <ids/ids.hpp>
#include <persistence/explorer_options.hpp>
#include <ssh/channel_source_interface.hpp>
#include <ssh/sftp_client_interface.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/thread_pool.hpp>

#include <expected>
#include <memory>
#include <string>

namespace Explorer
{
    /**
     * @brief Applies the log section of the options. An empty or missing file logs to the console only.
     */
    std::expected<void, std::string> configureLogging(Persistence::LogOptions const& options);

    /**
     * @brief One file browser on one connection: navigation, file operations and the transfer list, sharing the
     * primary sftp channel and an io thread pool.
     */
    class ExplorerSession
    {
      public:
        /**
         * @param ui The executor all state lives on. The owner must run it.
         * @param channelSource Provides the extra channels of multi channel transfers, may be null.
         * @param options Missing fields are taken from ExplorerOptions::defaults().
         */
        ExplorerSession(
            boost::asio::any_io_executor ui,
            std::shared_ptr<SecureShell::ISftpClient> primary,
            std::shared_ptr<SecureShell::ISftpChannelSource> channelSource,
            Persistence::ExplorerOptions options,
            NotificationSink notify = {});
        ~ExplorerSession();
        ExplorerSession(ExplorerSession const&) = delete;
        ExplorerSession& operator=(ExplorerSession const&) = delete;
        ExplorerSession(ExplorerSession&&) = delete;
        ExplorerSession& operator=(ExplorerSession&&) = delete;

        /**
         * @brief Opens the primary channel on an established ssh session and creates an explorer on it.
         */
        static std::expected<std::unique_ptr<ExplorerSession>, std::string> open(
            boost::asio::any_io_executor ui,
            std::shared_ptr<SecureShell::ISftpChannelSource> session,
            Persistence::ExplorerOptions options,
            NotificationSink notify = {});

        /**
         * @brief Resolves the home directory, shows it, preloads its ancestors for the tree and fetches the user
         * and group names. Call once, on the ui executor.
         */
        void start();

        Ids::SessionId const& id() const noexcept
        {
            return id_;
        }

        NavigationEngine& navigation()
        {
            return *navigation_;
        }
        FileOperations& fileOperations()
        {
            return fileOperations_;
        }
        TransferManager& transfers()
        {
            return *transfers_;
        }
        Persistence::ExplorerOptions const& options() const noexcept
        {
            return options_;
        }

      private:
        void onHomeResolved(std::string home);

      private:
        Ids::SessionId id_;
        Persistence::ExplorerOptions options_;
        boost::asio::thread_pool ioPool_;
        Executors executors_;
        std::shared_ptr<SecureShell::ISftpClient> primary_;
        std::shared_ptr<NavigationEngine> navigation_;
        FileOperations fileOperations_;
        std::shared_ptr<TransferManager> transfers_;
        // Guards the callbacks of start against a destroyed session.
        std::shared_ptr<bool> alive_;
    };
}
