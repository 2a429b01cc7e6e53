#include <persistence/explorer_options.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <fstream>

namespace Persistence
{
    std::expected<ExplorerOptions, std::string> loadExplorerOptions(std::filesystem::path const& path)
    {
        std::error_code error;
        if (!std::filesystem::exists(path, error))
        {
            Log::info("Options file '{}' does not exist, using defaults.", path.string());
            return ExplorerOptions::defaults();
        }

        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            return std::unexpected(fmt::format("Cannot open options file '{}'.", path.string()));

        ExplorerOptions options{};
        try
        {
            // Comments are allowed in the options file.
            nlohmann::json::parse(reader, nullptr, true, true).get_to(options);
        }
        catch (nlohmann::json::exception const& exc)
        {
            Log::error("Failed to parse options file '{}': {}", path.string(), exc.what());
            return std::unexpected(fmt::format("Failed to parse options file '{}': {}", path.string(), exc.what()));
        }

        options.useDefaultsFrom(ExplorerOptions::defaults());
        return options;
    }

    std::expected<void, std::string> saveExplorerOptions(std::filesystem::path const& path, ExplorerOptions const& options)
    {
        std::error_code error;
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path(), error);
        if (error)
            return std::unexpected(fmt::format("Cannot create '{}': {}", path.parent_path().string(), error.message()));

        std::ofstream writer{path, std::ios_base::binary | std::ios_base::trunc};
        if (!writer.good())
            return std::unexpected(fmt::format("Cannot write options file '{}'.", path.string()));

        writer << nlohmann::json(options).dump(4);
        if (!writer.good())
            return std::unexpected(fmt::format("Failed writing options file '{}'.", path.string()));
        return {};
    }
}
