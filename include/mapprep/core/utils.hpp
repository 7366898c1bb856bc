#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mapprep::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string format_iso_timestamp(Timestamp ts);
int64_t to_epoch_ms(Timestamp ts);
Timestamp from_epoch_ms(int64_t ms);
std::string generate_uuid();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
// Sibling path in the same directory, used for write-then-rename.
fs::path temp_sibling(const fs::path& target);
void replace_file(const fs::path& tmp, const fs::path& target);
void write_text_atomic(const fs::path& path, const std::string& text);
void copy_file_atomic(const fs::path& src, const fs::path& dst);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_text(const std::string& text);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

} // namespace mapprep::core
