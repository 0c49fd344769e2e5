#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace lookbook {

// ISO 8601 timestamp for the given epoch seconds (UTC)
std::string format_timestamp(uint64_t epoch);

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Last path component ("a/b/c.jpg" -> "c.jpg")
std::string base_name(const std::string& path);

// Case-insensitive suffix check
bool ends_with_ci(const std::string& s, const std::string& suffix);

// Standard base64 with padding
std::string base64_encode(const unsigned char* data, size_t len);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a whole file as bytes. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Write to path.tmp then rename over path. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace lookbook
