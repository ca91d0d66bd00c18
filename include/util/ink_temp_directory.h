#pragma once

#include <string>

namespace ink {

// Lower-case RFC 4122 string from libuuid
std::string GenerateUuid();

// A uniquely named scratch directory, <base>/<uuid>, removed on
// destruction unless Keep() was called. Removal failures are logged, never
// thrown.
class TempDirectory {
 public:
  // An empty base uses $TMPDIR, then /tmp. Throws ConfigurationError when
  // the base does not exist or the directory can not be created.
  explicit TempDirectory(const std::string& base_dir);
  ~TempDirectory();

  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  const std::string& path() const { return path_; }

  void Keep() { keep_ = true; }
  bool kept() const { return keep_; }

  // Deletes the directory now (ignores Keep()). Returns false on failure.
  bool Remove();

 private:
  std::string path_;
  bool keep_ = false;
  bool removed_ = false;
};

}  // namespace ink
