#include <shared_data/file_entry.hpp>
#include <utility/format_bytes.hpp>

namespace SharedData
{
    bool FileEntry::isHidden() const
    {
        return !name.empty() && name.front() == '.';
    }

    std::string FileEntry::extension() const
    {
        if (isDirectory())
            return {};

        auto const pos = name.rfind('.');
        if (pos == std::string::npos || pos + 1 == name.size())
            return {};
        return name.substr(pos + 1);
    }

    std::string FileEntry::formatSize() const
    {
        if (isDirectory())
            return "-";
        return Utility::formatBytes(size);
    }

    std::string FileEntry::formatPermissions() const
    {
        using std::filesystem::perms;

        std::string result;
        result.reserve(10);

        switch (type)
        {
            case FileType::Directory:
                result.push_back('d');
                break;
            case FileType::Symlink:
                result.push_back('l');
                break;
            default:
                result.push_back('-');
                break;
        }

        auto const flag = [this, &result](perms bit, char set) {
            result.push_back((permissions & bit) != perms::none ? set : '-');
        };
        flag(perms::owner_read, 'r');
        flag(perms::owner_write, 'w');
        flag(perms::owner_exec, 'x');
        flag(perms::group_read, 'r');
        flag(perms::group_write, 'w');
        flag(perms::group_exec, 'x');
        flag(perms::others_read, 'r');
        flag(perms::others_write, 'w');
        flag(perms::others_exec, 'x');
        return result;
    }
}
