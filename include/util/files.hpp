// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace forkscan {
namespace util {

/**
 * Write a string to a file atomically (crash-safe persistence)
 *
 * Writes to "<path>.tmp.<random>", fsyncs the file and its directory, then
 * renames over the target. Either the old or the new file is always intact.
 * Returns true on success, false on failure (temp file is removed).
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

/**
 * Read an entire file into a string
 * Returns an empty string on failure or if larger than 256MB.
 * Use std::filesystem::exists() to tell an empty file from a missing one.
 */
std::string read_file_string(const std::filesystem::path &path);

// Create directory (recursively). True on success or if it already exists.
bool ensure_directory(const std::filesystem::path &dir);

// ~/.forkscan, or ./.forkscan when HOME is unset
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace forkscan
