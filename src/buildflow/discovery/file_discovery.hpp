/**
 * @file file_discovery.hpp
 * @brief Glob-style discovery of project files under a root directory.
 */
#pragma once
#include "buildflow/common/common.hpp"

#include <filesystem>

namespace buildflow
{

namespace fs = std::filesystem;

/**
 * @brief Match a root-relative path against a glob pattern.
 *
 * @details
 * Both are split on '/'. A `**` segment matches zero or more whole path
 * segments; every other segment is matched with fnmatch(3) wildcards (`*`,
 * `?`, `[...]`), which never cross a '/'.
 *
 * @param relative_path Path relative to the discovery root, '/' separated.
 * @param pattern '/' separated glob pattern.
 */
bool path_matches(const std::string& relative_path, const std::string& pattern);

/**
 * @brief Find every regular file under root matching pattern.
 * @return Matching paths (root joined with the relative path), sorted so
 *         that repeated discoveries over an unchanged tree agree. Empty when
 *         root does not exist.
 */
std::vector<std::string> discover_files(const fs::path& root, const std::string& pattern);

/**
 * @brief Find the single file under root matching pattern.
 * @throws DiscoveryMismatchError if zero or more than one file matches.
 */
std::string discover_single_file(const fs::path& root, const std::string& pattern);

} // namespace buildflow
