#pragma once

#include <filesystem>
#include <string_view>

namespace Utility
{
    /**
     * @brief Creates a unique directory below the system temp path and removes it with all contents on destruction.
     */
    class TemporaryDirectory
    {
      public:
        explicit TemporaryDirectory(std::string_view prefix = "dir");
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

        std::filesystem::path operator/(std::filesystem::path const& relative) const;

      private:
        std::filesystem::path basePath_;
        std::filesystem::path path_;
    };
}
