#pragma once

#include <prompter/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace prompter::io {

/// Read a whole file. FileNotFound when it does not exist, IOError when it cannot be read.
Result<std::string> readFileContents(const std::filesystem::path& path);

/**
 * @brief Replace a file's content atomically
 *
 * Writes to a hidden temp file in the same directory and renames it over the
 * target, so readers observe either the old or the new content.
 */
Result<void> atomicWrite(const std::filesystem::path& path, const std::string& content);

/// Last modification time converted to the system clock
Result<TimePoint> fileModificationTime(const std::filesystem::path& path);

Result<uint64_t> fileSize(const std::filesystem::path& path);

} // namespace prompter::io
