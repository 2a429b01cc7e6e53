#pragma once

#include <shared_data/explorer_error.hpp>
#include <ssh/file_stream_interface.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>

namespace Explorer
{
    SharedData::ExplorerError cancelledError();
    SharedData::ExplorerError localIoError(std::string what);

    /**
     * @brief The configured chunk size, capped by what the stream accepts in one request. A limit of 0 means unknown.
     */
    std::size_t effectiveChunkSize(std::size_t configured, std::size_t streamLimit);

    std::expected<void, SharedData::ExplorerError>
    closeStream(SecureShell::IFileStream& stream, std::chrono::milliseconds timeout, std::string const& path);
}
