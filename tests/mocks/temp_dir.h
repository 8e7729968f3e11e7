#pragma once

#include <dirent.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace hitl {
namespace test {

/**
 * Unique directory under $TMPDIR, removed with its contents on destruction
 */
class TempDir {
 public:
  TempDir() {
    const char* base = std::getenv("TMPDIR");
    std::string pattern = std::string(base ? base : "/tmp") + "/hitl_test_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    char* created = ::mkdtemp(buffer.data());
    path_ = created ? created : "";
  }

  ~TempDir() { removeRecursive(path_); }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }

  std::string file(const std::string& name) const { return path_ + "/" + name; }

  // Entry names, excluding "." and ".."
  std::vector<std::string> entries() const { return listDir(path_); }

 private:
  static std::vector<std::string> listDir(const std::string& path) {
    std::vector<std::string> names;
    DIR* dir = ::opendir(path.c_str());
    if (!dir) {
      return names;
    }
    while (struct dirent* entry = ::readdir(dir)) {
      if (std::strcmp(entry->d_name, ".") != 0 &&
          std::strcmp(entry->d_name, "..") != 0) {
        names.push_back(entry->d_name);
      }
    }
    ::closedir(dir);
    return names;
  }

  static void removeRecursive(const std::string& path) {
    if (path.empty()) {
      return;
    }
    for (const auto& name : listDir(path)) {
      std::string full = path + "/" + name;
      struct stat st;
      if (::lstat(full.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        ::chmod(full.c_str(), 0700);
        removeRecursive(full);
      } else {
        ::unlink(full.c_str());
      }
    }
    ::rmdir(path.c_str());
  }

  std::string path_;
};

}  // namespace test
}  // namespace hitl
