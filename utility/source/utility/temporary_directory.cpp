#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory(std::string_view prefix)
        : basePath_{std::filesystem::temp_directory_path() / "sftp_explorer"}
        , path_{}
    {
        std::error_code error;
        std::filesystem::create_directories(basePath_, error);
        if (error)
            throw std::runtime_error("Could not create temporary base directory: " + error.message());

        std::string pattern{(basePath_ / (std::string{prefix} + "XXXXXX")).string()};
        if (mkdtemp(pattern.data()) == nullptr || !std::filesystem::is_directory(pattern))
            throw std::runtime_error("Could not setup temporary directory: " + pattern);
        path_ = pattern;
    }
    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
        // Only succeeds when no other instance is alive.
        std::filesystem::remove(basePath_, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }

    std::filesystem::path TemporaryDirectory::operator/(std::filesystem::path const& relative) const
    {
        return path_ / relative;
    }
}
