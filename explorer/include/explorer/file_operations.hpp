#pragma once

#include <explorer/navigation_engine.hpp>
#include <explorer/notification.hpp>
#include <shared_data/file_entry.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace Explorer
{
    /**
     * @brief File mutations from the browser context menu. Deletes are applied to the visible list right away and
     * rolled back if the server refuses them. Must be used on the ui executor.
     */
    class FileOperations
    {
      public:
        using StatCallback = std::function<void(std::expected<SharedData::FileEntry, std::string>)>;

        FileOperations(std::shared_ptr<NavigationEngine> engine, NotificationSink notify = {});

        /**
         * @brief Deletes a file or an empty directory, depending on the type of the known entry.
         */
        void remove(std::string const& path);

        /**
         * @brief Renames within the same directory. Fails without a round trip if newName is empty or contains '/'.
         */
        void rename(std::string const& path, std::string const& newName);

        void createDirectory(std::string const& name);
        void createFile(std::string const& name);

        /**
         * @brief Fetches fresh attributes for the properties panel.
         */
        void stat(std::string const& path, StatCallback onResult);

      private:
        void createEntry(std::string const& name, bool directory);
        void reportFailure(NavigationEngine& engine, std::string message) const;

      private:
        std::shared_ptr<NavigationEngine> engine_;
        NotificationSink notify_;
    };
}
