#pragma once

#include <ssh/sftp_client_interface.hpp>
#include <ssh/sftp_error.hpp>

#include <expected>
#include <future>
#include <memory>

namespace SecureShell
{
    /**
     * @brief Opens additional sftp channels over one connection. A server may refuse some of them.
     */
    class ISftpChannelSource
    {
      public:
        ISftpChannelSource() = default;
        virtual ~ISftpChannelSource() = default;
        ISftpChannelSource(ISftpChannelSource const&) = delete;
        ISftpChannelSource& operator=(ISftpChannelSource const&) = delete;
        ISftpChannelSource(ISftpChannelSource&&) = delete;
        ISftpChannelSource& operator=(ISftpChannelSource&&) = delete;

        virtual std::future<std::expected<std::shared_ptr<ISftpClient>, SftpError>> openSftpChannel() = 0;
    };
}
