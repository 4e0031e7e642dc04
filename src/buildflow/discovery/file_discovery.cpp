#include "buildflow/discovery/file_discovery.hpp"
#include "buildflow/common/buildflow_exceptions.hpp"

#include <algorithm>
#include <fnmatch.h>

#include <spdlog/spdlog.h>

namespace buildflow
{

namespace
{

std::vector<std::string> split_segments(const std::string& path)
{
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size())
    {
        size_t next = path.find('/', pos);
        std::string part =
            next == std::string::npos ? path.substr(pos) : path.substr(pos, next - pos);
        if (!part.empty() && part != ".")
        {
            segments.push_back(std::move(part));
        }
        if (next == std::string::npos)
        {
            break;
        }
        pos = next + 1;
    }
    return segments;
}

bool match_segments(const std::vector<std::string>& pattern, size_t pi,
                    const std::vector<std::string>& path, size_t si)
{
    if (pi == pattern.size())
    {
        return si == path.size();
    }

    if (pattern[pi] == "**")
    {
        // Zero segments, or consume one and stay on "**"
        if (match_segments(pattern, pi + 1, path, si))
        {
            return true;
        }
        return si < path.size() && match_segments(pattern, pi, path, si + 1);
    }

    if (si == path.size())
    {
        return false;
    }
    if (::fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) != 0)
    {
        return false;
    }
    return match_segments(pattern, pi + 1, path, si + 1);
}

} // namespace

bool path_matches(const std::string& relative_path, const std::string& pattern)
{
    return match_segments(split_segments(pattern), 0, split_segments(relative_path), 0);
}

std::vector<std::string> discover_files(const fs::path& root, const std::string& pattern)
{
    std::vector<std::string> matches;

    std::error_code ec;
    if (!fs::is_directory(root, ec))
    {
        spdlog::debug("Discovery root '{}' does not exist", root.string());
        return matches;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        spdlog::warn("Cannot scan '{}': {}", root.string(), ec.message());
        return matches;
    }

    fs::recursive_directory_iterator end;
    while (it != end)
    {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec))
        {
            const std::string relative = it->path().lexically_relative(root).generic_string();
            if (path_matches(relative, pattern))
            {
                matches.push_back(it->path().string());
            }
        }

        it.increment(ec);
        if (ec)
        {
            spdlog::warn("Error while scanning '{}': {}", root.string(), ec.message());
            break;
        }
    }

    std::sort(matches.begin(), matches.end());
    spdlog::debug("Pattern '{}' under '{}' matched {} file(s)", pattern, root.string(),
                  matches.size());
    return matches;
}

std::string discover_single_file(const fs::path& root, const std::string& pattern)
{
    std::vector<std::string> matches = discover_files(root, pattern);
    if (matches.size() != 1)
    {
        throw DiscoveryMismatchError(pattern, std::move(matches));
    }
    return matches.front();
}

} // namespace buildflow
