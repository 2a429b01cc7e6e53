#pragma once

#include <ssh/file_stream_interface.hpp>

#include <gmock/gmock.h>

namespace SecureShell::Test
{
    class FileStreamMock : public IFileStream
    {
      public:
        MOCK_METHOD(
            (std::future<std::expected<std::size_t, SftpError>>),
            read,
            (std::uint64_t offset, std::byte* buffer, std::size_t bufferSize),
            (override));
        MOCK_METHOD(
            (std::future<std::expected<void, SftpError>>),
            write,
            (std::uint64_t offset, std::span<std::byte const> data),
            (override));
        MOCK_METHOD((std::future<std::expected<FileInformation, SftpError>>), stat, (), (override));
        MOCK_METHOD(std::size_t, writeLengthLimit, (), (const, override));
        MOCK_METHOD(std::size_t, readLengthLimit, (), (const, override));
        MOCK_METHOD((std::future<std::expected<void, SftpError>>), close, (), (override));
    };
}
