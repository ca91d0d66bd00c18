#include "util/ink_temp_directory.h"
#include "core/ink_errors.h"
#include "util/ink_file_util.h"
#include "util/logger.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <uuid/uuid.h>

namespace ink {

std::string GenerateUuid() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return std::string(uuid_str);
}

TempDirectory::TempDirectory(const std::string& base_dir) {
  std::string base = base_dir;
  if (base.empty()) {
    const char* tmpdir = getenv("TMPDIR");
    base = tmpdir && *tmpdir ? tmpdir : "/tmp";
  }
  while (base.size() > 1 && base.back() == '/') base.pop_back();

  if (!DirectoryExists(base)) {
    throw ConfigurationError("The directory '" + base + "' does not exists");
  }

  path_ = base + "/" + GenerateUuid();
  if (mkdir(path_.c_str(), 0700) != 0) {
    throw ConfigurationError("Could not create temporary directory '" + path_ + "': " + strerror(errno));
  }
  LOG_DEBUG("TempDirectory", "Created " + path_);
}

TempDirectory::~TempDirectory() {
  if (keep_) {
    LOG_INFO("TempDirectory", "Keeping temporary folder '" + path_ + "'");
    return;
  }
  Remove();
}

bool TempDirectory::Remove() {
  if (removed_) {
    return true;
  }
  LOG_DEBUG("TempDirectory", "Deleting temporary folder '" + path_ + "'");
  std::string error;
  if (!RemoveTree(path_, &error)) {
    LOG_ERROR("TempDirectory", "Error deleting '" + path_ + "': " + error);
    return false;
  }
  removed_ = true;
  return true;
}

}  // namespace ink
