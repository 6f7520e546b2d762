/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef AOS_VPCS_UTILS_FILESYSTEM_HPP_
#define AOS_VPCS_UTILS_FILESYSTEM_HPP_

#include <filesystem>
#include <string>

#include <core/common/tools/error.hpp>

namespace aos::vpcs::utils {

/**
 * Joins base path and one or more entries into a single path.
 *
 * @param base base path.
 * @param entry first path entry.
 * @param entries additional path entries (variadic).
 * @return std::string.
 */
template <typename... Args>
std::string JoinPath(const std::string& base, const std::string& entry, Args&&... entries)
{
    auto path = std::filesystem::path(base) / entry;

    if constexpr (sizeof...(entries) > 0) {
        ((path /= std::forward<Args>(entries)), ...);
    }

    return path.string();
}

/**
 * Creates directory with all missing parents. Existing directory is not an error.
 *
 * @param path directory path.
 * @return Error.
 */
Error CreateDir(const std::string& path);

/**
 * Reads whole file content.
 *
 * @param path file path.
 * @return RetWithError<std::string>.
 */
RetWithError<std::string> ReadFile(const std::string& path);

/**
 * Checks that path is a regular file.
 *
 * @param path file path.
 * @return bool.
 */
bool IsRegularFile(const std::string& path);

/**
 * Checks that current process may execute file.
 *
 * @param path file path.
 * @return bool.
 */
bool IsExecutable(const std::string& path);

} // namespace aos::vpcs::utils

#endif
