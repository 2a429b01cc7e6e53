#pragma once

#include <utility/describe.hpp>

#include <cstdint>
#include <vector>

namespace Explorer
{
    struct ByteRange
    {
        std::uint64_t offset;
        std::uint64_t length;

        std::uint64_t end() const noexcept
        {
            return offset + length;
        }

        friend bool operator==(ByteRange const&, ByteRange const&) = default;
    };

    /**
     * @brief Splits [0, total) into count contiguous ranges of equal length. The last range also takes the remainder.
     * A count below 1 is treated as 1.
     */
    std::vector<ByteRange> computeByteRanges(std::uint64_t total, int count);

    BOOST_DEFINE_ENUM_CLASS(TransferStrategy, SingleChannel, MultiChannel)

    /**
     * @brief Large files go over several channels, provided more than one is configured.
     */
    TransferStrategy selectStrategy(std::uint64_t total, std::uint64_t threshold, int channelCount);
}
