#include "util/files.hpp"
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <unistd.h>

namespace rdvp {
namespace util {

namespace {

// Sync directory to ensure rename is durable
bool sync_directory(const std::filesystem::path &dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

// Generate random suffix for temp file
std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  // Write data (handle partial writes)
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      close(fd);
      std::filesystem::remove(temp_path);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    close(fd);
    std::filesystem::remove(temp_path);
    return false;
  }
  close(fd);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  // Make the rename durable
  if (!parent.empty() && !sync_directory(parent)) {
    return false;
  }
  return true;
}

bool read_file_string(const std::filesystem::path &path, std::string &out) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return false;
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    return false;
  }

  // Sanity check: refuse to read files larger than 100MB
  constexpr std::streamsize MAX_FILE_SIZE = 100 * 1024 * 1024;
  std::streamsize size = static_cast<std::streamsize>(pos);
  if (size < 0 || size > MAX_FILE_SIZE) {
    return false;
  }

  out.assign(static_cast<size_t>(size), '\0');
  file.seekg(0);
  file.read(out.data(), size);
  return static_cast<bool>(file);
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

} // namespace util
} // namespace rdvp
