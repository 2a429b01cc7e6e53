#include <explorer/transfer_util.hpp>
#include <explorer/async_result.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace Explorer
{
    SharedData::ExplorerError cancelledError()
    {
        return SharedData::ExplorerError{
            .type = SharedData::ExplorerErrorType::Cancelled,
            .extraInfo = "Cancelled by user",
        };
    }

    SharedData::ExplorerError localIoError(std::string what)
    {
        return SharedData::ExplorerError{
            .type = SharedData::ExplorerErrorType::LocalIoError,
            .extraInfo = std::move(what),
        };
    }

    std::size_t effectiveChunkSize(std::size_t configured, std::size_t streamLimit)
    {
        const auto chunk = std::max<std::size_t>(configured, 1);
        if (streamLimit == 0)
            return chunk;
        return std::min(chunk, streamLimit);
    }

    std::expected<void, SharedData::ExplorerError>
    closeStream(SecureShell::IFileStream& stream, std::chrono::milliseconds timeout, std::string const& path)
    {
        return awaitResult(stream.close(), timeout, fmt::format("Failed to close '{}'", path));
    }
}
