// XMLWITNESS - Filesystem Utilities
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// File helpers for the command-line tool: reading signed XML documents and
// writing witness files.

#ifndef XMLWITNESS_UTIL_FS_H
#define XMLWITNESS_UTIL_FS_H

#include <optional>
#include <string>

namespace xmlwitness {
namespace util {

/// Check if a regular file exists at path
bool Exists(const std::string& path);

/// Read entire file as bytes in a string (nullopt if it cannot be opened)
std::optional<std::string> ReadFile(const std::string& path);

/// Write content to path, replacing any existing file.
/// Data goes to "<path>.tmp" first and is renamed into place.
/// @return false if the file could not be written
bool WriteFile(const std::string& path, const std::string& content);

} // namespace util
} // namespace xmlwitness

#endif // XMLWITNESS_UTIL_FS_H
