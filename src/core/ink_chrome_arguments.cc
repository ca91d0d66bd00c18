#include "core/ink_chrome_arguments.h"
#include "core/ink_errors.h"
#include "util/logger.h"
#include <algorithm>
#include <cctype>

namespace ink {

namespace {

struct WindowSizeEntry {
  WindowSize size;
  const char* name;
  int width;
  int height;
};

const WindowSizeEntry kWindowSizes[] = {
  {WindowSize::SVGA, "SVGA", 800, 600},
  {WindowSize::WSVGA, "WSVGA", 1024, 600},
  {WindowSize::XGA, "XGA", 1024, 768},
  {WindowSize::XGAPLUS, "XGAPLUS", 1152, 864},
  {WindowSize::WXGA_5_3, "WXGA_5_3", 1280, 768},
  {WindowSize::WXGA_16_10, "WXGA_16_10", 1280, 800},
  {WindowSize::SXGA, "SXGA", 1280, 1024},
  {WindowSize::HD_1360_768, "HD_1360_768", 1360, 768},
  {WindowSize::HD_1366_768, "HD_1366_768", 1366, 768},
  {WindowSize::OTHER_1536_864, "OTHER_1536_864", 1536, 864},
  {WindowSize::HD_PLUS, "HD_PLUS", 1600, 900},
  {WindowSize::WSXGA_PLUS, "WSXGA_PLUS", 1680, 1050},
  {WindowSize::FHD, "FHD", 1920, 1080},
  {WindowSize::WUXGA, "WUXGA", 1920, 1200},
  {WindowSize::OTHER_2560_1070, "OTHER_2560_1070", 2560, 1070},
  {WindowSize::WQHD, "WQHD", 2560, 1440},
  {WindowSize::OTHER_3440_1440, "OTHER_3440_1440", 3440, 1440},
  {WindowSize::UHD_4K, "UHD_4K", 3840, 2160},
};

const char* kDefaultFlags[] = {
  "--headless",
  "--disable-gpu",
  "--hide-scrollbars",
  "--mute-audio",
  "--disable-background-networking",
  "--disable-background-timer-throttling",
  "--disable-default-apps",
  "--disable-extensions",
  "--disable-hang-monitor",
  "--disable-prompt-on-repost",
  "--disable-sync",
  "--disable-translate",
  "--metrics-recording-only",
  "--no-first-run",
  "--disable-crash-reporter",
};

const char* kMandatoryFlags[] = {
  "--headless",
  "--no-first-run",
  "--remote-debugging-port",
};

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

bool ParsePositiveInt(const std::string& text, int* out) {
  if (text.empty() || text.size() > 6) return false;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  *out = std::stoi(text);
  return *out > 0;
}

}  // namespace

void WindowSizeToPixels(WindowSize size, int* width, int* height) {
  for (const auto& entry : kWindowSizes) {
    if (entry.size == size) {
      *width = entry.width;
      *height = entry.height;
      return;
    }
  }
  throw ConfigurationError("Unknown window size preset");
}

bool ParseWindowSize(const std::string& text, int* width, int* height) {
  for (const auto& entry : kWindowSizes) {
    if (ToLower(text) == ToLower(entry.name)) {
      *width = entry.width;
      *height = entry.height;
      return true;
    }
  }

  size_t separator = text.find_first_of("x,");
  if (separator == std::string::npos) {
    return false;
  }
  return ParsePositiveInt(text.substr(0, separator), width) &&
         ParsePositiveInt(text.substr(separator + 1), height);
}

std::string ChromeFlag::ToDisplayString() const {
  return has_value ? name + "=\"" + value + "\"" : name;
}

std::string ChromeFlag::ToArgv() const {
  return has_value ? name + "=" + value : name;
}

ChromeArguments::ChromeArguments() {
  Reset();
}

void ChromeArguments::Reset() {
  flags_.clear();
  for (const char* flag : kDefaultFlags) {
    Add(flag);
  }
  Add("--remote-debugging-port", "0");
  Add("--window-size", "1366,768");
}

void ChromeArguments::Add(const std::string& flag) {
  if (IsBlank(flag)) {
    throw ConfigurationError("Chrome argument is empty or white space");
  }

  std::string lower = ToLower(flag);
  for (const auto& existing : flags_) {
    if (!existing.has_value && ToLower(existing.name) == lower) {
      return;
    }
  }

  LOG_DEBUG("ChromeArguments", "Adding Chrome argument '" + flag + "'");
  ChromeFlag entry;
  entry.name = flag;
  flags_.push_back(entry);
}

void ChromeArguments::Add(const std::string& name, const std::string& value) {
  if (IsBlank(name)) {
    throw ConfigurationError("Chrome argument is empty or white space");
  }

  for (auto& existing : flags_) {
    if (existing.has_value && existing.name == name) {
      existing.value = value;
      return;
    }
  }

  ChromeFlag entry;
  entry.name = name;
  entry.value = value;
  entry.has_value = true;
  LOG_DEBUG("ChromeArguments", "Adding Chrome argument '" + entry.ToDisplayString() + "'");
  flags_.push_back(entry);
}

bool ChromeArguments::Remove(const std::string& flag) {
  if (IsBlank(flag)) {
    throw ConfigurationError("Chrome argument is empty or white space");
  }

  std::string name = flag.substr(0, flag.find('='));
  for (const char* mandatory : kMandatoryFlags) {
    if (ToLower(name) == mandatory) {
      throw ConfigurationError("Can't remove '" + flag + "' argument, this argument is always needed");
    }
  }

  auto it = std::find_if(flags_.begin(), flags_.end(), [&](const ChromeFlag& existing) {
    if (existing.has_value) {
      return existing.name == flag || existing.ToDisplayString() == flag || existing.ToArgv() == flag;
    }
    return ToLower(existing.name) == ToLower(flag);
  });
  if (it == flags_.end()) {
    return false;
  }

  flags_.erase(it);
  LOG_DEBUG("ChromeArguments", "Removed Chrome argument '" + flag + "'");
  return true;
}

bool ChromeArguments::Contains(const std::string& name) const {
  std::string lower = ToLower(name);
  return std::any_of(flags_.begin(), flags_.end(), [&](const ChromeFlag& flag) {
    return flag.has_value ? flag.name == name : ToLower(flag.name) == lower;
  });
}

std::string ChromeArguments::ValueOf(const std::string& name) const {
  for (const auto& flag : flags_) {
    if (flag.has_value && flag.name == name) {
      return flag.value;
    }
  }
  return "";
}

std::vector<std::string> ChromeArguments::ToDisplayList() const {
  std::vector<std::string> list;
  for (const auto& flag : flags_) {
    list.push_back(flag.ToDisplayString());
  }
  return list;
}

std::vector<std::string> ChromeArguments::ToArgv() const {
  std::vector<std::string> argv;
  for (const auto& flag : flags_) {
    argv.push_back(flag.ToArgv());
  }
  return argv;
}

}  // namespace ink
