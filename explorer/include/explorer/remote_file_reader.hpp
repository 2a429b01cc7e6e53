#pragma once

#include <shared_data/explorer_error.hpp>
#include <ssh/sftp_client_interface.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>

namespace Explorer
{
    /**
     * @brief Reads a small remote text file completely. Blocks, so only call it from the io executor.
     *
     * @param maxSize Reading stops with an error once the file grows beyond this.
     */
    std::expected<std::string, SharedData::ExplorerError> readRemoteTextFile(
        SecureShell::ISftpClient& client,
        std::string const& path,
        std::chrono::milliseconds timeout,
        std::size_t maxSize = 4 * 1024 * 1024);
}
