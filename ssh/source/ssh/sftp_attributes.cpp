#include <ssh/sftp_attributes.hpp>
#include <utility/remote_path.hpp>

#include <libssh/sftp.h>

#include <chrono>

namespace SecureShell
{
    namespace
    {
        SharedData::FileType toFileType(std::uint8_t type)
        {
            switch (type)
            {
                case SSH_FILEXFER_TYPE_REGULAR:
                    return SharedData::FileType::File;
                case SSH_FILEXFER_TYPE_DIRECTORY:
                    return SharedData::FileType::Directory;
                case SSH_FILEXFER_TYPE_SYMLINK:
                    return SharedData::FileType::Symlink;
                case SSH_FILEXFER_TYPE_SPECIAL:
                    return SharedData::FileType::Other;
                default:
                    return SharedData::FileType::File;
            }
        }
    }

    FileInformation fromSftpAttributes(sftp_attributes attributes, std::string_view directory)
    {
        const std::string name = attributes->name ? std::string{attributes->name} : std::string{};

        FileInformation entry{
            .name = name,
            .path = name.empty() ? Utility::normalizeRemotePath(directory)
                                 : Utility::normalizeRemotePath(Utility::joinRemotePath(directory, name)),
            .type = toFileType(attributes->type),
            .size = attributes->size,
            .permissions = static_cast<std::filesystem::perms>(attributes->permissions) & std::filesystem::perms::mask,
        };

        if (attributes->flags & SSH_FILEXFER_ATTR_UIDGID)
        {
            entry.uid = attributes->uid;
            entry.gid = attributes->gid;
        }
        if (attributes->flags & SSH_FILEXFER_ATTR_ACMODTIME)
        {
            entry.modified = std::chrono::system_clock::time_point{
                std::chrono::seconds{static_cast<std::int64_t>(attributes->mtime)}};
        }
        return entry;
    }
}
