#pragma once

#include <utility/describe.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(FileType, File, Directory, Symlink, Other)

    /**
     * @brief One row of a remote directory listing. Entries are snapshots and are replaced as a whole on reload.
     */
    struct FileEntry
    {
        std::string name{};
        std::string path{};
        FileType type{FileType::File};
        std::uint64_t size{0};
        std::filesystem::perms permissions{std::filesystem::perms::none};
        std::optional<std::uint32_t> uid{std::nullopt};
        std::optional<std::uint32_t> gid{std::nullopt};
        std::optional<std::chrono::system_clock::time_point> modified{std::nullopt};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isFile() const
        {
            return type == FileType::File;
        }
        bool isSymlink() const
        {
            return type == FileType::Symlink;
        }

        /// Dotfiles, hidden unless show_hidden is set.
        bool isHidden() const;

        /**
         * @brief The part of the name after the last dot. Empty for directories and names without a dot.
         */
        std::string extension() const;

        /**
         * @brief Human readable size like "1.5 MB", "-" for directories.
         */
        std::string formatSize() const;

        /**
         * @brief ls style permission string, e.g. "drwxr-xr-x".
         */
        std::string formatPermissions() const;

        friend bool operator==(FileEntry const&, FileEntry const&) = default;
    };
}
