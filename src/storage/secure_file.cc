#define HITL_LOG_COMPONENT "storage"

#include "hitl/storage/secure_file.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include "hitl/core/error.h"
#include "hitl/logging/log_macros.h"

namespace hitl {
namespace storage {

namespace {

[[noreturn]] void throwErrno(const std::string& what, const std::string& path) {
  throw HitlError(ErrorCode::PERMISSION_ERROR,
                  what + " " + path + ": " + std::strerror(errno));
}

std::string parentOf(const std::string& path) {
  size_t slash = path.rfind('/');
  if (slash == std::string::npos) {
    return ".";
  }
  if (slash == 0) {
    return "/";
  }
  return path.substr(0, slash);
}

void writeAll(int fd, const std::string& content, const std::string& path) {
  const char* data = content.data();
  size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      throwErrno("Cannot write", path);
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }
}

// Writes a synced 0600 temp file next to path and returns its name
std::string writeTemp(const std::string& path, const std::string& content) {
  std::string pattern = path + ".tmp.XXXXXX";
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');

  int fd = ::mkstemp(name.data());
  if (fd < 0) {
    throwErrno("Cannot create temp file for", path);
  }
  std::string temp(name.data());

  try {
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
      throwErrno("Cannot chmod", temp);
    }
    writeAll(fd, content, temp);
    if (::fsync(fd) != 0) {
      throwErrno("Cannot sync", temp);
    }
  } catch (const HitlError&) {
    ::close(fd);
    ::unlink(temp.c_str());
    throw;
  }

  if (::close(fd) != 0) {
    ::unlink(temp.c_str());
    throwErrno("Cannot close", temp);
  }
  return temp;
}

}  // namespace

void ensureDirectory(const std::string& dir) {
  if (dir.empty()) {
    throw HitlError(ErrorCode::PERMISSION_ERROR, "Empty directory path");
  }

  struct stat st;
  if (::stat(dir.c_str(), &st) == 0) {
    if (!S_ISDIR(st.st_mode)) {
      throw HitlError(ErrorCode::PERMISSION_ERROR,
                      "Not a directory: " + dir);
    }
    if ((st.st_mode & 077) != 0 && ::chmod(dir.c_str(), S_IRWXU) != 0) {
      throwErrno("Cannot restrict permissions of", dir);
    }
    return;
  }

  std::string parent = parentOf(dir);
  if (parent != dir && parent != "/" && parent != ".") {
    struct stat parent_st;
    if (::stat(parent.c_str(), &parent_st) != 0) {
      ensureDirectory(parent);
    }
  }

  if (::mkdir(dir.c_str(), S_IRWXU) != 0 && errno != EEXIST) {
    throwErrno("Cannot create directory", dir);
  }
  HITL_LOG(Debug, "Created directory {}", dir);
}

void writeAtomic(const std::string& path, const std::string& content) {
  std::string temp = writeTemp(path, content);
  if (::rename(temp.c_str(), path.c_str()) != 0) {
    int saved = errno;
    ::unlink(temp.c_str());
    errno = saved;
    throwErrno("Cannot replace", path);
  }
}

bool writeOnce(const std::string& path, const std::string& content) {
  std::string temp = writeTemp(path, content);
  int rc = ::link(temp.c_str(), path.c_str());
  int saved = errno;
  ::unlink(temp.c_str());

  if (rc == 0) {
    return true;
  }
  if (saved == EEXIST) {
    HITL_LOG(Debug, "{} already exists, keeping it", path);
    return false;
  }
  errno = saved;
  throwErrno("Cannot create", path);
}

optional<std::string> readFile(const std::string& path, bool require_private) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT) {
      return nullopt;
    }
    throwErrno("Cannot open", path);
  }

  struct stat st;
  if (::fstat(fd, &st) != 0) {
    ::close(fd);
    throwErrno("Cannot stat", path);
  }
  if (require_private && (st.st_mode & 077) != 0) {
    ::close(fd);
    char mode[8];
    std::snprintf(mode, sizeof(mode), "%03o",
                  static_cast<unsigned>(st.st_mode & 0777));
    throw HitlError(ErrorCode::PERMISSION_ERROR,
                    path + " is accessible by other users (mode " + mode +
                        "); expected 600");
  }

  std::string content;
  char buffer[4096];
  for (;;) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      int saved = errno;
      ::close(fd);
      errno = saved;
      throwErrno("Cannot read", path);
    }
    if (n == 0) {
      break;
    }
    content.append(buffer, static_cast<size_t>(n));
  }
  ::close(fd);
  return content;
}

bool removeFile(const std::string& path) {
  if (::unlink(path.c_str()) == 0) {
    return true;
  }
  if (errno == ENOENT) {
    return false;
  }
  throwErrno("Cannot remove", path);
}

bool fileExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

int fileMode(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return static_cast<int>(st.st_mode & 0777);
}

}  // namespace storage
}  // namespace hitl
