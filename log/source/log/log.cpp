#include <log/log.hpp>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    std::expected<void, std::string> setup(Log::Level level, std::filesystem::path const& logFile)
    {
        return Detail::logger.setup(level, logFile);
    }

    void flush()
    {
        Detail::logger.flush();
    }
}
