#pragma once

#include <utility/describe.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace SecureShell
{
    /**
     * @brief Failures that are detected by the wrappers instead of libssh.
     */
    BOOST_DEFINE_ENUM_CLASS(
        WrapperErrors,
        None,
        OwnerNull,
        SharedPtrDestroyed,
        // The server wrote less than asked for, see sftp limits.
        ShortWrite,
        FileNull,
        ConnectionLost,
        StrandFinalized)

    /**
     * @brief Text for the SSH_FX_* status codes of sftp v3. Kept here so users of the interfaces do not need libssh.
     */
    constexpr std::string_view sftpStatusName(int status)
    {
        switch (status)
        {
            case 0:
                return "ok";
            case 1:
                return "eof";
            case 2:
                return "no such file";
            case 3:
                return "permission denied";
            case 4:
                return "failure";
            case 5:
                return "bad message";
            case 6:
                return "no connection";
            case 7:
                return "connection lost";
            case 8:
                return "op unsupported";
            case 11:
                return "file already exists";
            default:
                return "unknown";
        }
    }

    struct SftpError
    {
        std::string message;
        int sshError = 0;
        int sftpError = 0;
        WrapperErrors wrapperError = WrapperErrors::None;

        bool isConnectionLost() const noexcept
        {
            // SSH_FX_NO_CONNECTION, SSH_FX_CONNECTION_LOST
            return wrapperError == WrapperErrors::ConnectionLost || sftpError == 6 || sftpError == 7;
        }

        std::string toString() const
        {
            return fmt::format(
                "SftpError: message: {}, sshError: {}, sftpError: {} ({}), wrapperError: {}",
                message,
                sshError,
                sftpError,
                sftpStatusName(sftpError),
                boost::describe::enum_to_string(wrapperError, "INVALID_ENUM_VALUE"));
        }
    };
}
