#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(const std::string& data);
// Streams the file through SHA-256; throws SyncError(Io) when unreadable.
std::string sha256_file_hex(const std::filesystem::path& path);

std::string to_lower(std::string value);
std::string trim_copy(std::string value);
std::vector<std::string> split(const std::string& value, char separator);

std::string human_size(uint64_t bytes);
std::string format_utc(std::chrono::system_clock::time_point when);
// Accepts "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]"; returns false on anything else.
bool parse_iso8601(const std::string& text, std::chrono::system_clock::time_point& out);
