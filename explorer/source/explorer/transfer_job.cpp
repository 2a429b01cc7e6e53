#include <explorer/transfer_job.hpp>
#include <explorer/async_result.hpp>
#include <explorer/multi_channel_transfer.hpp>
#include <explorer/single_channel_transfer.hpp>
#include <explorer/transfer_util.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

#include <future>

namespace Explorer
{
    using SharedData::ExplorerError;
    using SharedData::ExplorerErrorType;

    TransferJob::TransferJob(
        TransferRequest request,
        std::shared_ptr<SecureShell::ISftpClient> primary,
        std::shared_ptr<SecureShell::ISftpChannelSource> channelSource,
        std::shared_ptr<TransferControl> control,
        TransferJobOptions options,
        TransferJobEvents events)
        : request_{std::move(request)}
        , primary_{std::move(primary)}
        , channelSource_{std::move(channelSource)}
        , control_{std::move(control)}
        , options_{std::move(options)}
        , events_{std::move(events)}
        , strategy_{std::nullopt}
    {
        if (options_.tempFileSuffix.empty() || options_.tempFileSuffix.find('/') != std::string::npos)
            options_.tempFileSuffix = ".filepart";
    }

    std::filesystem::path TransferJob::temporaryPath() const
    {
        return std::filesystem::path{request_.localPath.string() + options_.tempFileSuffix};
    }

    void TransferJob::run()
    {
        Log::info(
            "TransferJob: {} of '{}' <-> '{}' started.",
            Utility::enumToString(request_.direction, "Transfer"),
            request_.remotePath,
            request_.localPath.string());

        auto result = request_.direction == SharedData::TransferDirection::Download ? download() : upload();

        if (result)
            Log::info("TransferJob: '{}' completed.", request_.remotePath);
        else if (result.error().type == ExplorerErrorType::Cancelled)
            Log::info("TransferJob: '{}' cancelled.", request_.remotePath);
        else
            Log::error("TransferJob: '{}' failed: {}", request_.remotePath, result.error().toString());

        if (events_.onFinished)
            events_.onFinished(result);
    }

    std::vector<std::shared_ptr<SecureShell::ISftpClient>> TransferJob::acquireChannels()
    {
        std::vector<std::shared_ptr<SecureShell::ISftpClient>> channels{};
        if (!channelSource_)
            return channels;

        std::vector<std::future<std::expected<std::shared_ptr<SecureShell::ISftpClient>, SecureShell::SftpError>>>
            requests{};
        for (int i = 0; i < options_.channelCount; ++i)
            requests.push_back(channelSource_->openSftpChannel());

        for (auto& request : requests)
        {
            auto channel = awaitResult(std::move(request), options_.operationTimeout, "Failed to open sftp channel");
            if (!channel)
            {
                Log::warn("TransferJob: {}", channel.error().toString());
                continue;
            }
            if (*channel)
                channels.push_back(std::move(*channel));
        }
        return channels;
    }

    std::vector<std::shared_ptr<SecureShell::ISftpClient>> TransferJob::planChannels(std::uint64_t totalBytes)
    {
        if (selectStrategy(totalBytes, options_.multiChannelThreshold, options_.channelCount) ==
            TransferStrategy::MultiChannel)
        {
            auto channels = acquireChannels();
            if (channels.size() >= 2)
            {
                if (channels.size() < static_cast<std::size_t>(options_.channelCount))
                {
                    Log::warn(
                        "TransferJob: Got {} of {} channels for '{}'.",
                        channels.size(),
                        options_.channelCount,
                        request_.remotePath);
                }
                strategy_ = TransferStrategy::MultiChannel;
                return channels;
            }
            Log::warn(
                "TransferJob: Got {} of {} channels for '{}', using a single channel.",
                channels.size(),
                options_.channelCount,
                request_.remotePath);
        }
        strategy_ = TransferStrategy::SingleChannel;
        return {primary_};
    }

    std::expected<void, ExplorerError> TransferJob::download()
    {
        if (control_->isCancelled())
            return std::unexpected(cancelledError());

        auto info = awaitResult(
            primary_->stat(request_.remotePath),
            options_.operationTimeout,
            fmt::format("Failed to stat '{}'", request_.remotePath));
        if (!info)
            return std::unexpected(std::move(info).error());
        if (info->isDirectory())
        {
            return std::unexpected(ExplorerError{
                .type = ExplorerErrorType::InvalidPath,
                .extraInfo = fmt::format("'{}' is a directory", request_.remotePath),
            });
        }

        std::error_code ec{};
        if (std::filesystem::exists(request_.localPath, ec) && !options_.mayOverwrite)
        {
            return std::unexpected(ExplorerError{
                .type = ExplorerErrorType::FileExists,
                .extraInfo = fmt::format("'{}' already exists", request_.localPath.string()),
            });
        }
        if (request_.localPath.has_parent_path())
        {
            std::filesystem::create_directories(request_.localPath.parent_path(), ec);
            if (ec)
            {
                return std::unexpected(localIoError(
                    fmt::format("Cannot create '{}': {}", request_.localPath.parent_path().string(), ec.message())));
            }
        }

        const auto totalBytes = info->size;
        if (events_.onStarted)
            events_.onStarted(totalBytes);

        const auto temporary = temporaryPath();
        auto channels = planChannels(totalBytes);

        auto result = [&]() {
            if (*strategy_ == TransferStrategy::MultiChannel)
            {
                MultiChannelTransfer transfer{std::move(channels), control_, options_, events_.onProgress};
                return transfer.download(request_.remotePath, temporary, totalBytes);
            }
            SingleChannelTransfer transfer{primary_, control_, options_, events_.onProgress};
            return transfer.download(request_.remotePath, temporary, totalBytes);
        }();

        if (result && !control_->commit())
            result = std::unexpected(cancelledError());

        if (!result)
        {
            if (result.error().type == ExplorerErrorType::Cancelled || options_.doCleanup)
            {
                std::filesystem::remove(temporary, ec);
                if (ec)
                    Log::warn("TransferJob: Cannot remove '{}': {}", temporary.string(), ec.message());
            }
            return result;
        }

        if (std::filesystem::exists(request_.localPath, ec) && !options_.mayOverwrite)
        {
            if (options_.doCleanup)
                std::filesystem::remove(temporary, ec);
            return std::unexpected(ExplorerError{
                .type = ExplorerErrorType::FileExists,
                .extraInfo = fmt::format("'{}' already exists", request_.localPath.string()),
            });
        }

        std::filesystem::rename(temporary, request_.localPath, ec);
        if (ec)
        {
            return std::unexpected(localIoError(fmt::format(
                "Cannot rename '{}' to '{}': {}", temporary.string(), request_.localPath.string(), ec.message())));
        }
        return {};
    }

    std::expected<void, ExplorerError> TransferJob::upload()
    {
        if (control_->isCancelled())
            return std::unexpected(cancelledError());

        std::error_code ec{};
        const auto totalBytes = std::filesystem::file_size(request_.localPath, ec);
        if (ec)
        {
            return std::unexpected(
                localIoError(fmt::format("Cannot read size of '{}': {}", request_.localPath.string(), ec.message())));
        }

        if (!options_.mayOverwrite)
        {
            auto existing = awaitResult(
                primary_->stat(request_.remotePath),
                options_.operationTimeout,
                fmt::format("Failed to stat '{}'", request_.remotePath));
            if (existing)
            {
                return std::unexpected(ExplorerError{
                    .type = ExplorerErrorType::FileExists,
                    .extraInfo = fmt::format("'{}' already exists", request_.remotePath),
                });
            }
        }

        if (events_.onStarted)
            events_.onStarted(totalBytes);

        auto channels = planChannels(totalBytes);

        // A cancelled upload leaves the partial remote file behind.
        auto result = [&]() {
            if (*strategy_ == TransferStrategy::MultiChannel)
            {
                MultiChannelTransfer transfer{std::move(channels), control_, options_, events_.onProgress};
                return transfer.upload(request_.localPath, request_.remotePath, totalBytes);
            }
            SingleChannelTransfer transfer{primary_, control_, options_, events_.onProgress};
            return transfer.upload(request_.localPath, request_.remotePath, totalBytes);
        }();

        if (result && !control_->commit())
            return std::unexpected(cancelledError());
        return result;
    }
}
