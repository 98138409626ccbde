#pragma once
// hmb/io/fs_util.h
//
// Filesystem helpers for the result store and the report writers. Every
// failure is reported as ErrorKind::Store.

#include "hmb/core/error.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace hmb {
namespace io {

// Create `dir` (and parents) unless it already exists as a directory.
bool EnsureDirExists(const std::filesystem::path& dir, Error* err = nullptr);

bool ReadFileToString(const std::filesystem::path& p, std::string* out, Error* err = nullptr);

// Contents of a regular file, or nullopt when it is absent or unreadable.
std::optional<std::string> ReadFileIfPresent(const std::filesystem::path& p);

// Truncating write.
bool WriteStringToFile(const std::filesystem::path& p, std::string_view data,
                       Error* err = nullptr);

// Write "<p>.tmp" then rename it over `p`; readers see the old or the new
// content, never a partial file.
bool ReplaceFileAtomic(const std::filesystem::path& p, std::string_view data,
                       Error* err = nullptr);

// Map characters outside [A-Za-z0-9._-] to '_'. Empty input becomes "_".
std::string SanitizeName(std::string_view s);

// "2026-10-17T09:41:07Z"
std::string NowIso8601Utc();

}  // namespace io
}  // namespace hmb
