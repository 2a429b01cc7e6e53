#include <explorer/byte_range.hpp>

#include <algorithm>

namespace Explorer
{
    std::vector<ByteRange> computeByteRanges(std::uint64_t total, int count)
    {
        const auto parts = static_cast<std::uint64_t>(std::max(count, 1));
        const auto base = total / parts;

        std::vector<ByteRange> ranges{};
        ranges.reserve(parts);
        for (std::uint64_t i = 0; i < parts; ++i)
        {
            const auto offset = i * base;
            const auto length = i + 1 == parts ? total - offset : base;
            ranges.push_back(ByteRange{.offset = offset, .length = length});
        }
        return ranges;
    }

    TransferStrategy selectStrategy(std::uint64_t total, std::uint64_t threshold, int channelCount)
    {
        if (total >= threshold && channelCount > 1)
            return TransferStrategy::MultiChannel;
        return TransferStrategy::SingleChannel;
    }
}
