#pragma once

#include <shared_data/explorer_error_type.hpp>
#include <ssh/sftp_error.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>

namespace SharedData
{
    struct ExplorerError
    {
        ExplorerErrorType type;
        std::optional<SecureShell::SftpError> sftpError = std::nullopt;
        std::optional<std::string> extraInfo = std::nullopt;

        /**
         * @brief Text for inline error display. Context first, then the server message.
         */
        std::string message() const
        {
            if (extraInfo && sftpError)
                return fmt::format("{}: {}", *extraInfo, sftpError->message);
            if (extraInfo)
                return *extraInfo;
            if (sftpError)
                return sftpError->message;
            return boost::describe::enum_to_string(type, "UnknownError");
        }

        std::string toString() const
        {
            const auto enumString = boost::describe::enum_to_string(type, "INVALID_ENUM_VALUE");
            if (sftpError.has_value())
            {
                if (extraInfo)
                    return fmt::format("{}: {}. {}.", enumString, sftpError->toString(), *extraInfo);
                else
                    return fmt::format("{}: {}.", enumString, sftpError->toString());
            }
            if (extraInfo)
                return fmt::format("{}: {}.", enumString, *extraInfo);
            return enumString;
        }

        bool isConnectionLost() const
        {
            return type == ExplorerErrorType::ConnectionLost || (sftpError && sftpError->isConnectionLost());
        }

        static ExplorerError fromSftp(SecureShell::SftpError error, std::string context)
        {
            const auto type =
                error.isConnectionLost() ? ExplorerErrorType::ConnectionLost : ExplorerErrorType::ProtocolError;
            return ExplorerError{.type = type, .sftpError = std::move(error), .extraInfo = std::move(context)};
        }
    };
}
