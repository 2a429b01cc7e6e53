#pragma once

#include <ssh/sftp_client_interface.hpp>

#include <gmock/gmock.h>

namespace SecureShell::Test
{
    class SftpClientMock : public ISftpClient
    {
      public:
        MOCK_METHOD(
            (std::future<std::expected<std::vector<FileInformation>, Error>>),
            listDirectory,
            (std::string const& path),
            (override));
        MOCK_METHOD((std::future<std::expected<std::string, Error>>), canonicalize, (std::string const& path), (override));
        MOCK_METHOD((std::future<std::expected<FileInformation, Error>>), stat, (std::string const& path), (override));
        MOCK_METHOD(
            (std::future<std::expected<void, Error>>),
            createDirectory,
            (std::string const& path, std::filesystem::perms permissions),
            (override));
        MOCK_METHOD(
            (std::future<std::expected<void, Error>>),
            createFile,
            (std::string const& path, std::filesystem::perms permissions),
            (override));
        MOCK_METHOD((std::future<std::expected<void, Error>>), removeFile, (std::string const& path), (override));
        MOCK_METHOD((std::future<std::expected<void, Error>>), removeDirectory, (std::string const& path), (override));
        MOCK_METHOD(
            (std::future<std::expected<void, Error>>),
            rename,
            (std::string const& source, std::string const& destination),
            (override));
        MOCK_METHOD(
            (std::future<std::expected<void, Error>>),
            resize,
            (std::string const& path, std::uint64_t size),
            (override));
        MOCK_METHOD(
            (std::future<std::expected<std::shared_ptr<IFileStream>, Error>>),
            openFile,
            (std::string const& path, OpenType openType, std::filesystem::perms permissions),
            (override));
    };
}
