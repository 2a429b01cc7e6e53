#include <explorer/single_channel_transfer.hpp>
#include <explorer/async_result.hpp>
#include <explorer/transfer_util.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <span>
#include <vector>

namespace Explorer
{
    SingleChannelTransfer::SingleChannelTransfer(
        std::shared_ptr<SecureShell::ISftpClient> client,
        std::shared_ptr<TransferControl> control,
        TransferJobOptions options,
        ProgressCallback onProgress)
        : client_{std::move(client)}
        , control_{std::move(control)}
        , options_{std::move(options)}
        , onProgress_{std::move(onProgress)}
        , transferred_{0}
    {}

    bool SingleChannelTransfer::checkpoint(ProgressMeter& meter)
    {
        if (control_->isCancelled())
            return false;
        if (control_->waitWhilePaused())
            meter.rebase(transferred_);
        return !control_->isCancelled();
    }

    void SingleChannelTransfer::report(ProgressMeter& meter, std::uint64_t totalBytes)
    {
        if (auto speed = meter.sample(transferred_); speed && onProgress_)
            onProgress_(TransferProgress{.transferredBytes = transferred_, .totalBytes = totalBytes, .speed = *speed});
    }

    std::expected<void, SharedData::ExplorerError> SingleChannelTransfer::download(
        std::string const& remotePath,
        std::filesystem::path const& localFile,
        std::uint64_t totalBytes)
    {
        transferred_ = 0;
        auto stream = awaitResult(
            client_->openFile(remotePath, SecureShell::OpenType::Read),
            options_.operationTimeout,
            fmt::format("Failed to open '{}'", remotePath));
        if (!stream)
            return std::unexpected(std::move(stream).error());

        std::ofstream local{localFile, std::ios::binary | std::ios::trunc};
        if (!local.is_open())
            return std::unexpected(localIoError(fmt::format("Cannot open '{}' for writing", localFile.string())));

        std::vector<std::byte> buffer(effectiveChunkSize(options_.chunkSize, (*stream)->readLengthLimit()));
        ProgressMeter meter{options_.progressInterval};

        const auto result = [&]() -> std::expected<void, SharedData::ExplorerError> {
            while (true)
            {
                if (!checkpoint(meter))
                    return std::unexpected(cancelledError());

                auto amount = awaitResult(
                    (*stream)->read(transferred_, buffer.data(), buffer.size()),
                    options_.operationTimeout,
                    fmt::format("Failed to read '{}' at {}", remotePath, transferred_));
                if (!amount)
                    return std::unexpected(std::move(amount).error());
                if (*amount == 0)
                    return {};

                local.write(reinterpret_cast<char const*>(buffer.data()), static_cast<std::streamsize>(*amount));
                if (!local)
                    return std::unexpected(localIoError(fmt::format("Failed to write '{}'", localFile.string())));

                transferred_ += *amount;
                Log::trace("SingleChannelTransfer: {} bytes of '{}' at {}.", *amount, remotePath, transferred_);
                report(meter, totalBytes);
            }
        }();

        if (auto closed = closeStream(**stream, options_.operationTimeout, remotePath); !closed)
            Log::warn("SingleChannelTransfer: {}", closed.error().toString());

        local.close();
        if (!result)
            return result;
        if (!local)
            return std::unexpected(localIoError(fmt::format("Failed to finish writing '{}'", localFile.string())));

        if (onProgress_)
        {
            onProgress_(TransferProgress{
                .transferredBytes = transferred_,
                .totalBytes = std::max(totalBytes, transferred_),
                .speed = meter.speed(),
            });
        }
        return {};
    }

    std::expected<void, SharedData::ExplorerError> SingleChannelTransfer::upload(
        std::filesystem::path const& localFile,
        std::string const& remotePath,
        std::uint64_t totalBytes)
    {
        using SecureShell::OpenType;

        transferred_ = 0;
        std::ifstream local{localFile, std::ios::binary};
        if (!local.is_open())
            return std::unexpected(localIoError(fmt::format("Cannot open '{}' for reading", localFile.string())));

        auto stream = awaitResult(
            client_->openFile(remotePath, OpenType::Write | OpenType::Create | OpenType::Truncate),
            options_.operationTimeout,
            fmt::format("Failed to open '{}' for writing", remotePath));
        if (!stream)
            return std::unexpected(std::move(stream).error());

        std::vector<std::byte> buffer(effectiveChunkSize(options_.chunkSize, (*stream)->writeLengthLimit()));
        ProgressMeter meter{options_.progressInterval};

        auto result = [&]() -> std::expected<void, SharedData::ExplorerError> {
            while (true)
            {
                if (!checkpoint(meter))
                    return std::unexpected(cancelledError());

                local.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                const auto amount = static_cast<std::size_t>(local.gcount());
                if (local.bad())
                    return std::unexpected(localIoError(fmt::format("Failed to read '{}'", localFile.string())));
                if (amount == 0)
                    return {};

                auto written = awaitResult(
                    (*stream)->write(transferred_, std::span<std::byte const>{buffer.data(), amount}),
                    options_.operationTimeout,
                    fmt::format("Failed to write '{}' at {}", remotePath, transferred_));
                if (!written)
                    return std::unexpected(std::move(written).error());

                transferred_ += amount;
                Log::trace("SingleChannelTransfer: {} bytes of '{}' at {}.", amount, remotePath, transferred_);
                report(meter, totalBytes);
            }
        }();

        // A failed close can lose buffered data.
        auto closed = closeStream(**stream, options_.operationTimeout, remotePath);
        if (!result)
            return result;
        if (!closed)
            return closed;

        if (onProgress_)
        {
            onProgress_(TransferProgress{
                .transferredBytes = transferred_,
                .totalBytes = std::max(totalBytes, transferred_),
                .speed = meter.speed(),
            });
        }
        return {};
    }
}
