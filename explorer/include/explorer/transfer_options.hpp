#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Explorer
{
    struct TransferJobOptions
    {
        std::size_t chunkSize{256 * 1024};
        std::chrono::milliseconds progressInterval{100};
        std::chrono::milliseconds operationTimeout{std::chrono::seconds{5}};
        std::string tempFileSuffix{".filepart"};
        bool mayOverwrite{true};
        bool doCleanup{true};
        int channelCount{3};
        std::uint64_t multiChannelThreshold{10 * 1024 * 1024};
    };
}
