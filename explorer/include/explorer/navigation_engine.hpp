#pragma once

#include <explorer/directory_tree.hpp>
#include <explorer/executors.hpp>
#include <explorer/navigation_state.hpp>
#include <shared_data/explorer_error.hpp>
#include <shared_data/file_entry.hpp>
#include <ssh/sftp_client_interface.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Explorer
{
    class FileOperations;

    /**
     * @brief Owns the navigation state of one explorer session. Every public function must be called on the ui
     * executor. Directory listings are fetched on the io executor and applied when they come back.
     */
    class NavigationEngine : public std::enable_shared_from_this<NavigationEngine>
    {
      public:
        friend class FileOperations;

        struct Options
        {
            bool showHidden{false};
            std::chrono::milliseconds operationTimeout{std::chrono::seconds{5}};
        };

        static std::shared_ptr<NavigationEngine>
        create(Executors executors, std::shared_ptr<SecureShell::ISftpClient> client, Options options);

        NavigationEngine(NavigationEngine const&) = delete;
        NavigationEngine& operator=(NavigationEngine const&) = delete;
        NavigationEngine(NavigationEngine&&) = delete;
        NavigationEngine& operator=(NavigationEngine&&) = delete;
        ~NavigationEngine() = default;

        NavigationState const& state() const noexcept
        {
            return state_;
        }

        /**
         * @brief Makes home the current directory without recording history. Used once the home directory is known.
         */
        void initialize(std::string const& home);

        /**
         * @brief Shows path. A cached listing is shown immediately, an uncached one is fetched.
         * Leaving a directory records it in the history.
         */
        void navigateTo(std::string const& path);

        /// @return false if there is nothing to go back to.
        bool goBack();
        bool goForward();

        /// @return false at "/".
        bool goUp();
        void goHome();

        /**
         * @brief Drops the cached listing of the current directory and fetches it again. The stale list stays visible
         * until the new one arrives.
         */
        void refresh();

        void toggleExpand(std::string const& path);

        /**
         * @brief Flips the hidden filter. The filter applies to the file list and to the tree, so both
         * fileListRevision and expandedDirsRevision move.
         */
        void toggleShowHidden();

        /**
         * @brief Fetches a listing into the cache unless it is already cached. Does not change the current directory.
         */
        void preload(std::string const& path);

        /**
         * @brief Reads /etc/passwd and /etc/group from the server for owner display.
         */
        void loadUserGroupMaps();

        /**
         * @brief The file list with the hidden filter applied.
         */
        std::vector<SharedData::FileEntry> visibleFileList() const;

        std::vector<TreeRow> directoryTree() const;

        void clearError();

      private:
        NavigationEngine(Executors executors, std::shared_ptr<SecureShell::ISftpClient> client, Options options);

        void enterPath(std::string path, bool recordHistory);
        void expandToPath(std::string const& path);
        void load(std::string const& path);
        void onDirectoryLoaded(
            std::string const& path,
            std::expected<std::vector<SharedData::FileEntry>, SharedData::ExplorerError> result);
        void replaceFileList(std::vector<SharedData::FileEntry> entries);
        void reportError(SharedData::ExplorerError const& error);

        // Used by FileOperations. Positions of taken entries count the other pending removals too, so
        // overlapping removals can be put back in their original order.
        std::optional<SharedData::FileEntry> takeFromFileList(std::string const& path);
        bool restoreToFileList(std::string const& directory, SharedData::FileEntry entry);
        void forgetRemoval(std::string const& path);
        SharedData::FileEntry const* findEntry(std::string const& path) const;
        void invalidate(std::string const& path);
        void invalidateSubtree(std::string const& path);
        void reloadIfCurrent(std::string const& path);
        void setError(std::string error);

      private:
        struct PendingRemoval
        {
            std::string path;
            std::size_t position;
        };

      private:
        Executors executors_;
        std::shared_ptr<SecureShell::ISftpClient> client_;
        Options options_;
        NavigationState state_;
        std::size_t pendingLoads_;
        std::vector<PendingRemoval> pendingRemovals_;
    };
}
