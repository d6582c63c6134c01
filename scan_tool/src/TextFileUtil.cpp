#include "TextFileUtil.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace crashscan::scan_tool {

std::optional<std::string> ReadWholeFile(const std::filesystem::path& path, std::string* err)
{
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    if (err) *err = "open failed: " + path.string() + " (" + std::strerror(errno) + ")";
    return std::nullopt;
  }

  std::string out((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) {
    if (err) *err = "read failed: " + path.string();
    return std::nullopt;
  }
  return out;
}

bool WriteWholeFile(const std::filesystem::path& path, std::string_view data, std::string* err)
{
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.is_open()) {
    if (err) *err = "open for write failed: " + path.string() + " (" + std::strerror(errno) + ")";
    return false;
  }
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!f) {
    if (err) *err = "write failed: " + path.string();
    return false;
  }
  return true;
}

}  // namespace crashscan::scan_tool
