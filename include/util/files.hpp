// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace custody {
namespace util {

/**
 * Write a string to a file atomically
 *
 * Writes a temporary sibling file, fsyncs it and its directory, then renames
 * it over the target, so readers see either the old or the new content.
 *
 * @param mode File permissions of the new file (e.g. 0600 for tenant metadata)
 * @return true on success
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read an entire file
 * @return contents, or std::nullopt if the file is missing, unreadable or
 *         larger than 16MB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

// Create directory (recursively). True if it exists afterwards.
bool ensure_directory(const std::filesystem::path &dir);

// ~/.custody, or ./.custody when HOME is unset
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace custody
