#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace crashscan::scan_tool {

// Reads a whole text file as bytes (crash logs and config files are ASCII/UTF-8).
std::optional<std::string> ReadWholeFile(const std::filesystem::path& path, std::string* err);

// Replaces the file contents. Returns false (with err) on failure.
bool WriteWholeFile(const std::filesystem::path& path, std::string_view data, std::string* err);

}  // namespace crashscan::scan_tool
