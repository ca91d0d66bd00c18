#include "core/ink_chrome_finder.h"
#include "util/logger.h"
#include <cstdlib>
#include <sstream>
#include <unistd.h>

namespace ink {

std::string FindChromeExecutable() {
  const char* names[] = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
    "chrome",
    nullptr
  };

  const char* search_path = getenv("PATH");
  if (search_path) {
    for (const char** name = names; *name; ++name) {
      std::istringstream dirs(search_path);
      std::string dir;
      while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + *name;
        if (access(candidate.c_str(), X_OK) == 0) {
          LOG_DEBUG("ChromeFinder", "Found " + candidate);
          return candidate;
        }
      }
    }
  }

  const char* paths[] = {
    "/opt/google/chrome/chrome",
    "/opt/google/chrome-beta/chrome",
    "/usr/lib/chromium/chromium",
    "/usr/lib/chromium-browser/chromium-browser",
    "/snap/bin/chromium",
    nullptr
  };

  for (const char** path = paths; *path; ++path) {
    if (access(*path, X_OK) == 0) {
      return std::string(*path);
    }
  }

  return "";
}

}  // namespace ink
