#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Utility
{
    /**
     * @brief Turns any remote path into an absolute one without "." or ".." segments, duplicate or trailing
     * slashes. The empty path and everything that climbs above the root becomes "/".
     */
    std::string normalizeRemotePath(std::string_view path);

    /**
     * @brief Returns the parent of a normalized path. The parent of "/" is "/".
     */
    std::string remoteParentPath(std::string_view path);

    /**
     * @brief Appends name to base with exactly one separator.
     */
    std::string joinRemotePath(std::string_view base, std::string_view name);

    /**
     * @brief Returns the last segment of the path, empty for "/".
     */
    std::string remoteFileName(std::string_view path);

    /**
     * @brief Returns "/" followed by every prefix of the path, ending with the path itself.
     * "/home/user" yields {"/", "/home", "/home/user"}.
     */
    std::vector<std::string> remotePathChain(std::string_view path);

    /**
     * @brief True if candidate is path or lies somewhere below it.
     */
    bool isRemoteSubPath(std::string_view path, std::string_view candidate);
}
