#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

std::string hex_from_bytes(const unsigned char* data, std::size_t length);

// Human readable byte count ("512 B", "1.50 KB", "3.25 GB").
std::string format_size(uint64_t bytes);
// "0h 1m 5s" style, truncated to whole seconds.
std::string format_duration(std::chrono::steady_clock::duration elapsed);

// Returns the relative path an archive entry name should be written to, or
// nullopt when the name is empty, absolute or climbs out with "..".
std::optional<std::filesystem::path> safe_relative_path(const std::string& entry_name);
