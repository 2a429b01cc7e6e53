#include <explorer/explorer_session.hpp>
#include <explorer/async_result.hpp>
#include <log/log.hpp>
#include <utility/remote_path.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace Explorer
{
    namespace
    {
        Persistence::ExplorerOptions withDefaults(Persistence::ExplorerOptions options)
        {
            options.useDefaultsFrom(Persistence::ExplorerOptions::defaults());
            return options;
        }

        std::chrono::milliseconds operationTimeout(Persistence::ExplorerOptions const& options)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                options.operationTimeout.value_or(std::chrono::seconds{5}));
        }

        TransferManager::Options transferOptions(Persistence::ExplorerOptions const& options)
        {
            auto const& transfer = options.transfer;
            return TransferManager::Options{
                .job =
                    TransferJobOptions{
                        .chunkSize = *transfer.chunkSize,
                        .progressInterval = *transfer.progressInterval,
                        .operationTimeout = operationTimeout(options),
                        .tempFileSuffix = *transfer.tempFileSuffix,
                        .mayOverwrite = *transfer.mayOverwrite,
                        .doCleanup = *transfer.doCleanup,
                        .channelCount = transfer.effectiveChannelCount(),
                        .multiChannelThreshold = *transfer.multiChannelThreshold,
                    },
                .parallelTransfers = *transfer.parallelTransfers,
            };
        }
    }

    std::expected<void, std::string> configureLogging(Persistence::LogOptions const& options)
    {
        return Log::setup(
            Log::levelFromString(options.level.value_or("info")),
            std::filesystem::path{options.file.value_or(std::string{})});
    }

    ExplorerSession::ExplorerSession(
        boost::asio::any_io_executor ui,
        std::shared_ptr<SecureShell::ISftpClient> primary,
        std::shared_ptr<SecureShell::ISftpChannelSource> channelSource,
        Persistence::ExplorerOptions options,
        NotificationSink notify)
        : id_{Ids::generateSessionId()}
        , options_{withDefaults(std::move(options))}
        , ioPool_{static_cast<std::size_t>(std::max(*options_.ioThreads, 1))}
        , executors_{.ui = std::move(ui), .io = ioPool_.get_executor()}
        , primary_{std::move(primary)}
        , navigation_{NavigationEngine::create(
              executors_,
              primary_,
              NavigationEngine::Options{
                  .showHidden = *options_.navigation.showHidden,
                  .operationTimeout = operationTimeout(options_),
              })}
        , fileOperations_{navigation_, notify}
        , transfers_{TransferManager::create(
              executors_,
              primary_,
              std::move(channelSource),
              transferOptions(options_),
              notify)}
        , alive_{std::make_shared<bool>(true)}
    {
        Log::info("ExplorerSession: Created session {}.", id_.value());
    }

    ExplorerSession::~ExplorerSession()
    {
        alive_.reset();
        // Joins the transfer threads.
        transfers_.reset();
        ioPool_.join();
        Log::info("ExplorerSession: Closed session {}.", id_.value());
    }

    std::expected<std::unique_ptr<ExplorerSession>, std::string> ExplorerSession::open(
        boost::asio::any_io_executor ui,
        std::shared_ptr<SecureShell::ISftpChannelSource> session,
        Persistence::ExplorerOptions options,
        NotificationSink notify)
    {
        if (!session)
            return std::unexpected(std::string{"No ssh session"});

        const auto timeout = operationTimeout(withDefaults(options));
        auto primary = awaitResult(session->openSftpChannel(), timeout, "Failed to open the primary sftp channel");
        if (!primary)
        {
            Log::error("ExplorerSession: {}", primary.error().toString());
            return std::unexpected(primary.error().message());
        }

        return std::make_unique<ExplorerSession>(
            std::move(ui), std::move(*primary), std::move(session), std::move(options), std::move(notify));
    }

    void ExplorerSession::start()
    {
        dispatch(
            executors_,
            [client = primary_, timeout = operationTimeout(options_)]() {
                return awaitResult(client->canonicalize("."), timeout, "Failed to resolve the home directory");
            },
            [this, alive = std::weak_ptr<bool>{alive_}](std::expected<std::string, SharedData::ExplorerError> result) {
                if (alive.expired())
                    return;
                if (!result)
                {
                    Log::warn("ExplorerSession: {}, starting at '/'.", result.error().toString());
                    onHomeResolved("/");
                    return;
                }
                onHomeResolved(std::move(*result));
            });
    }

    void ExplorerSession::onHomeResolved(std::string home)
    {
        home = Utility::normalizeRemotePath(home);
        Log::info("ExplorerSession: Home directory is '{}'.", home);

        navigation_->initialize(home);
        for (auto const& ancestor : Utility::remotePathChain(home))
        {
            if (ancestor != home)
                navigation_->preload(ancestor);
        }
        navigation_->loadUserGroupMaps();
    }
}
