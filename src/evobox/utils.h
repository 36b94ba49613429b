#ifndef EVOBOX_UTILS_H_
#define EVOBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <evobox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);
// empty if the file cannot be read
std::string ReadFile(const fs::path&);

// A file or directory under the system temp directory, removed on destruction.
class TempPath {
  fs::path path_;
  explicit TempPath(fs::path&& path) : path_(std::move(path)) {}
 public:
  TempPath() {}
  TempPath(TempPath&& x) : path_(std::move(x.path_)) { x.path_.clear(); }
  TempPath& operator=(TempPath&&);
  TempPath(const TempPath&) = delete;
  TempPath& operator=(const TempPath&) = delete;
  ~TempPath();

  // the returned path is empty on failure
  static TempPath Directory(const std::string& prefix);
  static TempPath File(const std::string& prefix, const std::string& suffix);

  const fs::path& Path() const { return path_; }
  bool Valid() const { return !path_.empty(); }
};

#endif  // EVOBOX_UTILS_H_
