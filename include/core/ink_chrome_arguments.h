#pragma once

#include <string>
#include <vector>

namespace ink {

// Common viewport presets
enum class WindowSize {
  SVGA,             // 800 x 600
  WSVGA,            // 1024 x 600
  XGA,              // 1024 x 768
  XGAPLUS,          // 1152 x 864
  WXGA_5_3,         // 1280 x 768
  WXGA_16_10,       // 1280 x 800
  SXGA,             // 1280 x 1024
  HD_1360_768,
  HD_1366_768,
  OTHER_1536_864,
  HD_PLUS,          // 1600 x 900
  WSXGA_PLUS,       // 1680 x 1050
  FHD,              // 1920 x 1080
  WUXGA,            // 1920 x 1200
  OTHER_2560_1070,
  WQHD,             // 2560 x 1440
  OTHER_3440_1440,
  UHD_4K            // 3840 x 2160
};

void WindowSizeToPixels(WindowSize size, int* width, int* height);

// Parses "1366x768", "1366,768" or a preset name ("FHD"). Returns false for
// anything else.
bool ParseWindowSize(const std::string& text, int* width, int* height);

// One command line flag, bare ("--headless") or valued ("--window-size=1366,768").
struct ChromeFlag {
  std::string name;
  std::string value;
  bool has_value = false;

  // --name="value", the form used in logs and listings
  std::string ToDisplayString() const;

  // --name=value, the form handed to execv()
  std::string ToArgv() const;
};

// Ordered browser flag set.
//
// Bare flags are de-duplicated case insensitively; adding a valued flag
// replaces the existing flag with the same name. The flags that make the
// browser controllable cannot be removed.
class ChromeArguments {
 public:
  ChromeArguments();

  // Restores the default set.
  void Reset();

  // Throws ConfigurationError for an empty flag.
  void Add(const std::string& flag);
  void Add(const std::string& name, const std::string& value);

  // Accepts a bare flag, a flag name or the display form of a valued flag.
  // Throws ConfigurationError for --headless, --no-first-run and
  // --remote-debugging-port. Returns whether something was removed.
  bool Remove(const std::string& flag);

  bool Contains(const std::string& name) const;

  // Value of a valued flag, empty when absent.
  std::string ValueOf(const std::string& name) const;

  std::vector<std::string> ToDisplayList() const;
  std::vector<std::string> ToArgv() const;

  const std::vector<ChromeFlag>& flags() const { return flags_; }

 private:
  std::vector<ChromeFlag> flags_;
};

}  // namespace ink
