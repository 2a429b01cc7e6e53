#include <persistence/explorer_options.hpp>

#include <algorithm>

namespace Persistence
{
    void NavigationOptions::useDefaultsFrom(NavigationOptions const& other)
    {
        if (!showHidden)
            showHidden = other.showHidden;
    }
    void to_json(nlohmann::json& j, NavigationOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, showHidden);
    }
    void from_json(nlohmann::json const& j, NavigationOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, showHidden);
    }

    void TransferOptions::useDefaultsFrom(TransferOptions const& other)
    {
        if (!channelCount)
            channelCount = other.channelCount;
        if (!multiChannelThreshold)
            multiChannelThreshold = other.multiChannelThreshold;
        if (!chunkSize)
            chunkSize = other.chunkSize;
        if (!progressInterval)
            progressInterval = other.progressInterval;
        if (!tempFileSuffix)
            tempFileSuffix = other.tempFileSuffix;
        if (!mayOverwrite)
            mayOverwrite = other.mayOverwrite;
        if (!doCleanup)
            doCleanup = other.doCleanup;
        if (!parallelTransfers)
            parallelTransfers = other.parallelTransfers;
    }
    int TransferOptions::effectiveChannelCount() const
    {
        return std::clamp(channelCount.value_or(minimumChannelCount), minimumChannelCount, maximumChannelCount);
    }
    void to_json(nlohmann::json& j, TransferOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, channelCount);
        TO_JSON_OPTIONAL(j, options, multiChannelThreshold);
        TO_JSON_OPTIONAL(j, options, chunkSize);
        TO_JSON_OPTIONAL(j, options, progressInterval);
        TO_JSON_OPTIONAL(j, options, tempFileSuffix);
        TO_JSON_OPTIONAL(j, options, mayOverwrite);
        TO_JSON_OPTIONAL(j, options, doCleanup);
        TO_JSON_OPTIONAL(j, options, parallelTransfers);
    }
    void from_json(nlohmann::json const& j, TransferOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, channelCount);
        FROM_JSON_OPTIONAL(j, options, multiChannelThreshold);
        FROM_JSON_OPTIONAL(j, options, chunkSize);
        FROM_JSON_OPTIONAL(j, options, progressInterval);
        FROM_JSON_OPTIONAL(j, options, tempFileSuffix);
        FROM_JSON_OPTIONAL(j, options, mayOverwrite);
        FROM_JSON_OPTIONAL(j, options, doCleanup);
        FROM_JSON_OPTIONAL(j, options, parallelTransfers);
    }

    void LogOptions::useDefaultsFrom(LogOptions const& other)
    {
        if (!level)
            level = other.level;
        if (!file)
            file = other.file;
    }
    void to_json(nlohmann::json& j, LogOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, level);
        TO_JSON_OPTIONAL(j, options, file);
    }
    void from_json(nlohmann::json const& j, LogOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, level);
        FROM_JSON_OPTIONAL(j, options, file);
    }

    void ExplorerOptions::useDefaultsFrom(ExplorerOptions const& other)
    {
        navigation.useDefaultsFrom(other.navigation);
        transfer.useDefaultsFrom(other.transfer);
        log.useDefaultsFrom(other.log);
        if (!operationTimeout)
            operationTimeout = other.operationTimeout;
        if (!ioThreads)
            ioThreads = other.ioThreads;
    }
    ExplorerOptions ExplorerOptions::defaults()
    {
        return ExplorerOptions{
            .navigation =
                {
                    .showHidden = false,
                },
            .transfer =
                {
                    .channelCount = 3,
                    .multiChannelThreshold = 10ull * 1024 * 1024,
                    .chunkSize = 256 * 1024,
                    .progressInterval = std::chrono::milliseconds{100},
                    .tempFileSuffix = ".filepart",
                    .mayOverwrite = true,
                    .doCleanup = true,
                    .parallelTransfers = 3,
                },
            .log =
                {
                    .level = "info",
                },
            .operationTimeout = std::chrono::seconds{5},
            .ioThreads = 2,
        };
    }
    void to_json(nlohmann::json& j, ExplorerOptions const& options)
    {
        j = nlohmann::json::object();
        j["navigation"] = options.navigation;
        j["transfer"] = options.transfer;
        j["log"] = options.log;
        TO_JSON_OPTIONAL(j, options, operationTimeout);
        TO_JSON_OPTIONAL(j, options, ioThreads);
    }
    void from_json(nlohmann::json const& j, ExplorerOptions& options)
    {
        if (j.contains("navigation"))
            j["navigation"].get_to(options.navigation);
        if (j.contains("transfer"))
            j["transfer"].get_to(options.transfer);
        if (j.contains("log"))
            j["log"].get_to(options.log);
        FROM_JSON_OPTIONAL(j, options, operationTimeout);
        FROM_JSON_OPTIONAL(j, options, ioThreads);
    }
}
