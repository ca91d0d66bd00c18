#pragma once

#include <string>

namespace ink {

// Locates a Chromium-family executable: each of google-chrome,
// google-chrome-stable, chromium, chromium-browser and chrome on $PATH,
// then the usual install locations. Returns an empty string when nothing
// executable is found.
std::string FindChromeExecutable();

}  // namespace ink
