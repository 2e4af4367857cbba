#ifndef NETMETER_HELPERS_FILES_HPP
#define NETMETER_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File I/O and path utilities.
 *
 * Small-file reads (sysfs counters, operstate) use C-style I/O into fixed
 * buffers. Whole-file reads and atomic replacement are used for the day
 * history and settings files.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, mkdir, S_ISDIR
#include <unistd.h>   // read, write, close, fsync

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>  // std::rename
#include <cstdlib> // strtoull
#include <string>

namespace netmeter {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Size for small integer file reads.
inline constexpr std::size_t INT_READ_BUFFER_SIZE = 64;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read (excluding null terminator), 0 on error.
 *
 * Strips trailing newlines and carriage returns. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    return 0;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  netmeter::helpers::strings::stripTrailingWhitespace(buf, total);

  return total;
}

/**
 * @brief Read an unsigned 64-bit counter from a file.
 * @param path File path to read.
 * @param out Parsed value (untouched on failure).
 * @return true if the file was readable and held a number.
 */
[[nodiscard]] inline bool readFileUint64(const char* path, std::uint64_t& out) noexcept {
  std::array<char, INT_READ_BUFFER_SIZE> buf{};
  if (readFileToBuffer(path, buf.data(), buf.size()) == 0) {
    return false;
  }

  char* end = nullptr;
  const unsigned long long VAL = std::strtoull(buf.data(), &end, 10);
  if (end == buf.data()) {
    return false;
  }

  out = static_cast<std::uint64_t>(VAL);
  return true;
}

/**
 * @brief Read an entire file into a string.
 * @param path File path to read.
 * @param out Destination (replaced).
 * @return 0 on success, otherwise the errno of the failing call.
 */
[[nodiscard]] inline int readFileToString(const std::string& path, std::string& out) {
  out.clear();

  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return errno;
  }

  std::array<char, 4096> chunk{};
  for (;;) {
    const ssize_t N = ::read(FD, chunk.data(), chunk.size());
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int ERR = errno;
      ::close(FD);
      return ERR;
    }
    if (N == 0) {
      break;
    }
    out.append(chunk.data(), static_cast<std::size_t>(N));
  }

  ::close(FD);
  return 0;
}

/* ----------------------------- File Writing ----------------------------- */

/**
 * @brief Replace a file's contents atomically (write temp, fsync, rename).
 * @param path Destination path.
 * @param content Bytes to write.
 * @return 0 on success, otherwise the errno of the failing call.
 *
 * Readers observe either the old or the new contents, never a torn file.
 */
[[nodiscard]] inline int writeFileAtomic(const std::string& path, const std::string& content) {
  const std::string TMP = path + ".tmp";

  const int FD = ::open(TMP.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (FD < 0) {
    return errno;
  }

  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t N = ::write(FD, content.data() + written, content.size() - written);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int ERR = errno;
      ::close(FD);
      ::unlink(TMP.c_str());
      return ERR;
    }
    written += static_cast<std::size_t>(N);
  }

  if (::fsync(FD) != 0) {
    const int ERR = errno;
    ::close(FD);
    ::unlink(TMP.c_str());
    return ERR;
  }
  ::close(FD);

  if (std::rename(TMP.c_str(), path.c_str()) != 0) {
    const int ERR = errno;
    ::unlink(TMP.c_str());
    return ERR;
  }

  return 0;
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path exists (file or directory).
 */
[[nodiscard]] inline bool pathExists(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  return ::stat(path, &st) == 0;
}

/**
 * @brief Check if path is a directory.
 */
[[nodiscard]] inline bool isDirectory(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

/**
 * @brief Create a directory and any missing parents (mode 0755).
 * @param path Directory path.
 * @return 0 on success (including already present), otherwise errno.
 */
[[nodiscard]] inline int makeDirectories(const std::string& path) {
  if (path.empty()) {
    return EINVAL;
  }

  std::string partial;
  partial.reserve(path.size());
  for (std::size_t i = 0; i < path.size(); ++i) {
    partial.push_back(path[i]);
    const bool AT_END = (i + 1 == path.size());
    if ((path[i] == '/' && i != 0) || AT_END) {
      if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
        return errno;
      }
    }
  }

  return isDirectory(path.c_str()) ? 0 : ENOTDIR;
}

} // namespace files
} // namespace helpers
} // namespace netmeter

#endif // NETMETER_HELPERS_FILES_HPP
