#pragma once

#include <shared_data/explorer_error.hpp>
#include <ssh/sftp_error.hpp>

#include <chrono>
#include <exception>
#include <expected>
#include <future>
#include <string>
#include <type_traits>

namespace Explorer
{
    /**
     * @brief Waits for a protocol result. Timeouts and broken promises become errors, sftp errors are tagged with
     * context.
     */
    template <typename T>
    std::expected<T, SharedData::ExplorerError> awaitResult(
        std::future<std::expected<T, SecureShell::SftpError>> future,
        std::chrono::milliseconds timeout,
        std::string context)
    {
        using SharedData::ExplorerError;
        using SharedData::ExplorerErrorType;

        if (!future.valid())
            return std::unexpected(ExplorerError{.type = ExplorerErrorType::ProtocolError, .extraInfo = std::move(context)});

        if (future.wait_for(timeout) != std::future_status::ready)
        {
            return std::unexpected(ExplorerError{
                .type = ExplorerErrorType::FutureTimeout,
                .extraInfo = std::move(context) + ": operation timed out",
            });
        }

        try
        {
            auto result = future.get();
            if (!result)
                return std::unexpected(ExplorerError::fromSftp(std::move(result).error(), std::move(context)));
            if constexpr (std::is_void_v<T>)
                return {};
            else
                return std::move(*result);
        }
        catch (std::exception const& exc)
        {
            return std::unexpected(ExplorerError{
                .type = ExplorerErrorType::ProtocolError,
                .extraInfo = std::move(context) + ": " + exc.what(),
            });
        }
    }
}
