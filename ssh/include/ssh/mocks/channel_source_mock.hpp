#pragma once

#include <ssh/channel_source_interface.hpp>

#include <gmock/gmock.h>

namespace SecureShell::Test
{
    class ChannelSourceMock : public ISftpChannelSource
    {
      public:
        MOCK_METHOD(
            (std::future<std::expected<std::shared_ptr<ISftpClient>, SftpError>>),
            openSftpChannel,
            (),
            (override));
    };
}
