#include <explorer/multi_channel_transfer.hpp>
#include <explorer/async_result.hpp>
#include <explorer/transfer_util.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <fstream>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <thread>

namespace Explorer
{
    MultiChannelTransfer::MultiChannelTransfer(
        std::vector<std::shared_ptr<SecureShell::ISftpClient>> channels,
        std::shared_ptr<TransferControl> control,
        TransferJobOptions options,
        ProgressCallback onProgress)
        : channels_{std::move(channels)}
        , control_{std::move(control)}
        , options_{std::move(options)}
        , onProgress_{std::move(onProgress)}
        , transferredPerRange_{}
    {
        if (channels_.empty())
            throw std::invalid_argument("MultiChannelTransfer needs at least one channel");
    }

    bool MultiChannelTransfer::checkpoint(ProgressAccumulator& accumulator)
    {
        if (control_->isCancelled())
            return false;
        if (control_->waitWhilePaused())
            accumulator.rebase();
        return !control_->isCancelled();
    }

    std::expected<void, SharedData::ExplorerError>
    MultiChannelTransfer::runWorkers(std::uint64_t totalBytes, RangeWorker const& worker)
    {
        const auto ranges = computeByteRanges(totalBytes, static_cast<int>(channels_.size()));
        ProgressAccumulator accumulator{totalBytes, ranges.size(), options_.progressInterval, onProgress_};

        std::mutex errorGuard{};
        std::optional<std::pair<std::size_t, SharedData::ExplorerError>> firstError{};
        const auto recordError = [&](std::size_t index, SharedData::ExplorerError error) {
            std::scoped_lock lock{errorGuard};
            if (firstError)
                return;
            Log::error("MultiChannelTransfer: Range {} failed: {}", index, error.toString());
            firstError.emplace(index, std::move(error));
            // Stops the sibling ranges, including paused ones.
            control_->cancel();
        };

        std::vector<std::thread> workers{};
        workers.reserve(ranges.size());
        for (std::size_t i = 0; i != ranges.size(); ++i)
        {
            workers.emplace_back([&, i]() {
                try
                {
                    auto result = worker(i, ranges[i], accumulator);
                    if (!result && result.error().type != SharedData::ExplorerErrorType::Cancelled)
                        recordError(i, std::move(result).error());
                }
                catch (std::exception const& exc)
                {
                    recordError(i, localIoError(exc.what()));
                }
            });
        }
        for (auto& thread : workers)
            thread.join();

        transferredPerRange_.clear();
        for (std::size_t i = 0; i != ranges.size(); ++i)
            transferredPerRange_.push_back(accumulator.transferredBy(i));

        if (firstError)
        {
            return std::unexpected(SharedData::ExplorerError{
                .type = SharedData::ExplorerErrorType::PartialWorkerFailure,
                .extraInfo = fmt::format("Range {} failed: {}", firstError->first, firstError->second.message()),
            });
        }
        if (control_->isCancelled())
            return std::unexpected(cancelledError());

        accumulator.flush();
        return {};
    }

    std::expected<void, SharedData::ExplorerError> MultiChannelTransfer::download(
        std::string const& remotePath,
        std::filesystem::path const& localFile,
        std::uint64_t totalBytes)
    {
        {
            std::ofstream create{localFile, std::ios::binary | std::ios::trunc};
            if (!create.is_open())
                return std::unexpected(localIoError(fmt::format("Cannot create '{}'", localFile.string())));
        }
        std::error_code ec{};
        std::filesystem::resize_file(localFile, totalBytes, ec);
        if (ec)
        {
            return std::unexpected(
                localIoError(fmt::format("Cannot reserve {} bytes for '{}': {}", totalBytes, localFile.string(), ec.message())));
        }

        Log::info(
            "MultiChannelTransfer: Downloading '{}' over {} channels.", remotePath, channels_.size());

        return runWorkers(
            totalBytes,
            [this, &remotePath, &localFile](
                std::size_t index,
                ByteRange const& range,
                ProgressAccumulator& accumulator) -> std::expected<void, SharedData::ExplorerError> {
                auto stream = awaitResult(
                    channels_[index]->openFile(remotePath, SecureShell::OpenType::Read),
                    options_.operationTimeout,
                    fmt::format("Failed to open '{}'", remotePath));
                if (!stream)
                    return std::unexpected(std::move(stream).error());

                std::fstream local{localFile, std::ios::in | std::ios::out | std::ios::binary};
                if (!local.is_open())
                    return std::unexpected(localIoError(fmt::format("Cannot open '{}'", localFile.string())));
                local.seekp(static_cast<std::streamoff>(range.offset));

                std::vector<std::byte> buffer(effectiveChunkSize(options_.chunkSize, (*stream)->readLengthLimit()));
                auto position = range.offset;

                auto result = [&]() -> std::expected<void, SharedData::ExplorerError> {
                    while (position < range.end())
                    {
                        if (!checkpoint(accumulator))
                            return std::unexpected(cancelledError());

                        const auto wanted = static_cast<std::size_t>(
                            std::min<std::uint64_t>(buffer.size(), range.end() - position));
                        auto amount = awaitResult(
                            (*stream)->read(position, buffer.data(), wanted),
                            options_.operationTimeout,
                            fmt::format("Failed to read '{}' at {}", remotePath, position));
                        if (!amount)
                            return std::unexpected(std::move(amount).error());
                        if (*amount == 0)
                        {
                            return std::unexpected(SharedData::ExplorerError{
                                .type = SharedData::ExplorerErrorType::ProtocolError,
                                .extraInfo = fmt::format("'{}' ended early at {}", remotePath, position),
                            });
                        }

                        local.write(
                            reinterpret_cast<char const*>(buffer.data()), static_cast<std::streamsize>(*amount));
                        if (!local)
                            return std::unexpected(localIoError(fmt::format("Failed to write '{}'", localFile.string())));

                        position += *amount;
                        accumulator.add(index, *amount);
                        Log::trace("MultiChannelTransfer: Range {} at {}.", index, position);
                    }
                    local.flush();
                    if (!local)
                        return std::unexpected(localIoError(fmt::format("Failed to flush '{}'", localFile.string())));
                    return {};
                }();

                if (auto closed = closeStream(**stream, options_.operationTimeout, remotePath); !closed)
                    Log::warn("MultiChannelTransfer: {}", closed.error().toString());
                return result;
            });
    }

    std::expected<void, SharedData::ExplorerError>
    MultiChannelTransfer::prepareRemoteFile(std::string const& remotePath, std::uint64_t totalBytes)
    {
        using SecureShell::OpenType;

        auto& channel = *channels_.front();
        auto stream = awaitResult(
            channel.openFile(remotePath, OpenType::Write | OpenType::Create | OpenType::Truncate),
            options_.operationTimeout,
            fmt::format("Failed to create '{}'", remotePath));
        if (!stream)
            return std::unexpected(std::move(stream).error());

        if (auto closed = closeStream(**stream, options_.operationTimeout, remotePath); !closed)
            return closed;

        return awaitResult(
            channel.resize(remotePath, totalBytes),
            options_.operationTimeout,
            fmt::format("Failed to reserve {} bytes for '{}'", totalBytes, remotePath));
    }

    std::expected<void, SharedData::ExplorerError> MultiChannelTransfer::upload(
        std::filesystem::path const& localFile,
        std::string const& remotePath,
        std::uint64_t totalBytes)
    {
        if (auto prepared = prepareRemoteFile(remotePath, totalBytes); !prepared)
            return prepared;

        Log::info("MultiChannelTransfer: Uploading '{}' over {} channels.", remotePath, channels_.size());

        return runWorkers(
            totalBytes,
            [this, &remotePath, &localFile](
                std::size_t index,
                ByteRange const& range,
                ProgressAccumulator& accumulator) -> std::expected<void, SharedData::ExplorerError> {
                std::ifstream local{localFile, std::ios::binary};
                if (!local.is_open())
                    return std::unexpected(localIoError(fmt::format("Cannot open '{}'", localFile.string())));
                local.seekg(static_cast<std::streamoff>(range.offset));

                auto stream = awaitResult(
                    channels_[index]->openFile(remotePath, SecureShell::OpenType::Write),
                    options_.operationTimeout,
                    fmt::format("Failed to open '{}' for writing", remotePath));
                if (!stream)
                    return std::unexpected(std::move(stream).error());

                std::vector<std::byte> buffer(effectiveChunkSize(options_.chunkSize, (*stream)->writeLengthLimit()));
                auto position = range.offset;

                auto result = [&]() -> std::expected<void, SharedData::ExplorerError> {
                    while (position < range.end())
                    {
                        if (!checkpoint(accumulator))
                            return std::unexpected(cancelledError());

                        const auto wanted = static_cast<std::size_t>(
                            std::min<std::uint64_t>(buffer.size(), range.end() - position));
                        local.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
                        if (static_cast<std::size_t>(local.gcount()) != wanted)
                        {
                            return std::unexpected(
                                localIoError(fmt::format("'{}' ended early at {}", localFile.string(), position)));
                        }

                        auto written = awaitResult(
                            (*stream)->write(position, std::span<std::byte const>{buffer.data(), wanted}),
                            options_.operationTimeout,
                            fmt::format("Failed to write '{}' at {}", remotePath, position));
                        if (!written)
                            return std::unexpected(std::move(written).error());

                        position += wanted;
                        accumulator.add(index, wanted);
                        Log::trace("MultiChannelTransfer: Range {} at {}.", index, position);
                    }
                    return {};
                }();

                auto closed = closeStream(**stream, options_.operationTimeout, remotePath);
                if (!result)
                    return result;
                return closed;
            });
    }
}
