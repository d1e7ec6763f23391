#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sky_cutout::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string new_task_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
// Writes to a sibling temporary file and renames it over `path`, so readers
// never observe a partially written file.
void write_bytes_atomic(const fs::path& path, const std::vector<uint8_t>& data);
void safe_hardlink_or_copy(const fs::path& src, const fs::path& dst);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Parses the whole of `text` as a decimal number in the "C" locale
std::optional<double> parse_double(const std::string& text);

bool message_indicates_disk_full(const std::string& message);

} // namespace sky_cutout::core
