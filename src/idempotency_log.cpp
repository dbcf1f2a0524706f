/**
 * @file idempotency_log.cpp
 * @brief Idempotency log implementation
 */

#include "transcode_watchdog/idempotency_log.hpp"

#include <cerrno>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

namespace transcode_watchdog {

IdempotencyLog::IdempotencyLog(std::string path) : path_(std::move(path)) {
  load();
}

void IdempotencyLog::load() {
  std::ifstream in(path_);
  if (!in)
    return;

  std::string line;
  while (std::getline(in, line)) {
    auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
      continue;
    auto last = line.find_last_not_of(" \t\r\n");
    entries_.insert(line.substr(first, last - first + 1));
  }
}

bool IdempotencyLog::contains(const std::string &path) const {
  return entries_.count(path) > 0;
}

std::error_code IdempotencyLog::append(const std::string &path) {
  entries_.insert(path);

  int fd = open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1)
    return std::error_code(errno, std::generic_category());

  std::string line = path + "\n";
  size_t written = 0;
  while (written < line.size()) {
    ssize_t n = write(fd, line.data() + written, line.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      std::error_code ec(errno, std::generic_category());
      close(fd);
      return ec;
    }
    written += static_cast<size_t>(n);
  }

  if (fsync(fd) == -1) {
    std::error_code ec(errno, std::generic_category());
    close(fd);
    return ec;
  }
  if (close(fd) == -1)
    return std::error_code(errno, std::generic_category());
  return {};
}

} // namespace transcode_watchdog
