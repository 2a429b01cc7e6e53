#include <utility/remote_path.hpp>

namespace Utility
{
    std::string normalizeRemotePath(std::string_view path)
    {
        std::vector<std::string_view> segments;
        std::size_t position = 0;
        while (position <= path.size())
        {
            auto const next = path.find('/', position);
            auto const end = next == std::string_view::npos ? path.size() : next;
            auto const segment = path.substr(position, end - position);

            if (segment == "..")
            {
                if (!segments.empty())
                    segments.pop_back();
            }
            else if (!segment.empty() && segment != ".")
                segments.push_back(segment);

            if (next == std::string_view::npos)
                break;
            position = next + 1;
        }

        if (segments.empty())
            return "/";

        std::string result;
        for (auto const& segment : segments)
        {
            result.push_back('/');
            result.append(segment);
        }
        return result;
    }

    std::string remoteParentPath(std::string_view path)
    {
        while (path.size() > 1 && path.back() == '/')
            path.remove_suffix(1);

        auto const pos = path.rfind('/');
        if (pos == std::string_view::npos || pos == 0)
            return "/";
        return std::string{path.substr(0, pos)};
    }

    std::string joinRemotePath(std::string_view base, std::string_view name)
    {
        while (!base.empty() && base.back() == '/')
            base.remove_suffix(1);
        while (!name.empty() && name.front() == '/')
            name.remove_prefix(1);

        std::string result{base};
        result.push_back('/');
        result.append(name);
        return result;
    }

    std::string remoteFileName(std::string_view path)
    {
        while (!path.empty() && path.back() == '/')
            path.remove_suffix(1);

        auto const pos = path.rfind('/');
        if (pos == std::string_view::npos)
            return std::string{path};
        return std::string{path.substr(pos + 1)};
    }

    std::vector<std::string> remotePathChain(std::string_view path)
    {
        std::vector<std::string> chain{"/"};
        std::string current;
        std::size_t position = 0;
        while (position < path.size())
        {
            auto next = path.find('/', position);
            if (next == std::string_view::npos)
                next = path.size();

            auto const segment = path.substr(position, next - position);
            if (!segment.empty())
            {
                current.push_back('/');
                current.append(segment);
                chain.push_back(current);
            }
            position = next + 1;
        }
        return chain;
    }

    bool isRemoteSubPath(std::string_view path, std::string_view candidate)
    {
        if (path == "/")
            return !candidate.empty() && candidate.front() == '/';
        if (!candidate.starts_with(path))
            return false;
        return candidate.size() == path.size() || candidate[path.size()] == '/';
    }
}
