#pragma once

#include <ssh/file_information.hpp>

#include <libssh/sftp.h>

#include <string_view>

namespace SecureShell
{
    /**
     * @brief Converts libssh attributes into an entry that lives in directory.
     */
    FileInformation fromSftpAttributes(sftp_attributes attributes, std::string_view directory);
}
