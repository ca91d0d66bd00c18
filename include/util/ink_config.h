#pragma once

/**
 * Inkwell configuration.
 *
 * Priority order: CLI args > Environment variables > Config file > Defaults
 *
 * Environment variables:
 *   INK_CHROME_PATH - Path to the Chrome/Chromium binary (default: searched)
 *   INK_USER_PROFILE - Profile directory, selects the named-profile mode
 *   INK_CONVERSION_TIMEOUT_MS - Budget for one conversion (default: none)
 *   INK_TEMP_DIR - Base directory for scratch files (default: $TMPDIR or /tmp)
 *   INK_LOG_FILE - Also append log lines to this file
 *   INK_LOG_LEVEL - debug, info, warn or error (default: info)
 */

#include "core/ink_page_settings.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ink {

class Converter;
struct ConversionOptions;

// Default configuration values
constexpr int kDefaultWindowWidth = 1366;
constexpr int kDefaultWindowHeight = 768;
constexpr int64_t kDefaultWindowStatusTimeoutMs = 60000;

struct Config {
  // Browser
  std::string chrome_path;
  std::string user_profile;
  std::vector<std::string> chrome_arguments;  // Extra flags, "--name" or "--name=value"
  std::string proxy_server;
  std::string proxy_bypass_list;
  std::string proxy_pac_url;
  std::string user_agent;
  std::string disk_cache_dir;
  int64_t disk_cache_size_mb = 0;     // 0 = let the browser decide
  int window_width = kDefaultWindowWidth;
  int window_height = kDefaultWindowHeight;
  std::string run_as_user;

  // Conversion
  int64_t conversion_timeout_ms = 0;  // 0 = no budget
  int64_t media_load_timeout_ms = 0;  // 0 = wait for the load event
  std::string wait_for_window_status;
  int64_t wait_for_window_status_timeout_ms = kDefaultWindowStatusTimeoutMs;
  std::vector<std::string> url_blacklist;
  std::vector<std::string> pre_wrap_extensions;
  std::string run_javascript;
  bool capture_snapshot = false;
  bool log_network_traffic = false;
  bool use_cache = false;
  std::string temp_dir;
  bool keep_temp_dir = false;

  PageSettings page_settings;

  // Logging
  std::string log_level = "info";
  std::string log_file;

  // Reads a JSON configuration file. Keys missing from the file keep their
  // current value. Throws ConfigurationError.
  void LoadFile(const std::string& path);

  // Reads the INK_* environment variables listed above. Throws
  // ConfigurationError for malformed numbers.
  void LoadEnvironment();

  // Throws ConfigurationError.
  void Validate() const;

  // Initializes InkLogger from log_level and log_file.
  void InitLogging() const;

  // Converter with this configuration's browser and conversion settings.
  std::unique_ptr<Converter> CreateConverter() const;

  // Pushes the settings that are not constructor arguments into `converter`.
  void ApplyTo(Converter& converter) const;

  ConversionOptions ToConversionOptions() const;
};

// Parses a whole decimal number. Throws ConfigurationError naming `what`.
int64_t ParseConfigInt(const std::string& text, const std::string& what);

// Splits "a,b, c" into trimmed, non-empty items
std::vector<std::string> SplitList(const std::string& text, char separator = ',');

}  // namespace ink
