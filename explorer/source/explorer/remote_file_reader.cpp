#include <explorer/remote_file_reader.hpp>
#include <explorer/async_result.hpp>
#include <explorer/transfer_util.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <vector>

namespace Explorer
{
    std::expected<std::string, SharedData::ExplorerError> readRemoteTextFile(
        SecureShell::ISftpClient& client,
        std::string const& path,
        std::chrono::milliseconds timeout,
        std::size_t maxSize)
    {
        auto stream = awaitResult(client.openFile(path), timeout, fmt::format("Failed to open '{}'", path));
        if (!stream)
            return std::unexpected(std::move(stream).error());

        std::string content{};
        std::vector<std::byte> buffer(effectiveChunkSize(32768, (*stream)->readLengthLimit()));
        while (true)
        {
            auto amount = awaitResult(
                (*stream)->read(content.size(), buffer.data(), buffer.size()),
                timeout,
                fmt::format("Failed to read '{}'", path));
            if (!amount)
                return std::unexpected(std::move(amount).error());
            if (*amount == 0)
                break;

            content.append(reinterpret_cast<char const*>(buffer.data()), *amount);
            if (content.size() > maxSize)
            {
                return std::unexpected(SharedData::ExplorerError{
                    .type = SharedData::ExplorerErrorType::ProtocolError,
                    .extraInfo = fmt::format("'{}' is larger than {} bytes", path, maxSize),
                });
            }
        }

        // The content is complete at this point.
        if (auto closed = awaitResult((*stream)->close(), timeout, fmt::format("Failed to close '{}'", path)); !closed)
            Log::warn("readRemoteTextFile: {}", closed.error().toString());
        return content;
    }
}
