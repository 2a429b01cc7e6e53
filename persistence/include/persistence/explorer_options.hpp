#pragma once

#include <persistence/state_core.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    struct NavigationOptions
    {
        std::optional<bool> showHidden{std::nullopt};

        void useDefaultsFrom(NavigationOptions const& other);
    };
    void to_json(nlohmann::json& j, NavigationOptions const& options);
    void from_json(nlohmann::json const& j, NavigationOptions& options);

    struct TransferOptions
    {
        constexpr static int minimumChannelCount = 1;
        constexpr static int maximumChannelCount = 8;

        // Parallel sftp channels for one large transfer, clamped to [1, 8].
        std::optional<int> channelCount{std::nullopt};
        // Files of at least this size are split across channels.
        std::optional<std::uint64_t> multiChannelThreshold{std::nullopt};
        std::optional<std::size_t> chunkSize{std::nullopt};
        std::optional<std::chrono::milliseconds> progressInterval{std::nullopt};
        std::optional<std::string> tempFileSuffix{std::nullopt};
        std::optional<bool> mayOverwrite{std::nullopt};
        std::optional<bool> doCleanup{std::nullopt};
        // Transfers that may run at the same time, the rest waits in the queue.
        std::optional<int> parallelTransfers{std::nullopt};

        void useDefaultsFrom(TransferOptions const& other);

        /**
         * @brief channelCount clamped into the allowed range. Unset counts as 1.
         */
        int effectiveChannelCount() const;
    };
    void to_json(nlohmann::json& j, TransferOptions const& options);
    void from_json(nlohmann::json const& j, TransferOptions& options);

    struct LogOptions
    {
        std::optional<std::string> level{std::nullopt};
        std::optional<std::string> file{std::nullopt};

        void useDefaultsFrom(LogOptions const& other);
    };
    void to_json(nlohmann::json& j, LogOptions const& options);
    void from_json(nlohmann::json const& j, LogOptions& options);

    struct ExplorerOptions
    {
        NavigationOptions navigation{};
        TransferOptions transfer{};
        LogOptions log{};
        std::optional<std::chrono::seconds> operationTimeout{std::nullopt};
        std::optional<int> ioThreads{std::nullopt};

        void useDefaultsFrom(ExplorerOptions const& other);

        /**
         * @brief Every field set to the built-in value.
         */
        static ExplorerOptions defaults();
    };
    void to_json(nlohmann::json& j, ExplorerOptions const& options);
    void from_json(nlohmann::json const& j, ExplorerOptions& options);

    /**
     * @brief Reads options from a JSON file. Missing fields are filled from ExplorerOptions::defaults(), a missing
     * file yields the defaults.
     */
    std::expected<ExplorerOptions, std::string> loadExplorerOptions(std::filesystem::path const& path);

    std::expected<void, std::string> saveExplorerOptions(std::filesystem::path const& path, ExplorerOptions const& options);
}
