#include "util/ink_config.h"
#include "core/ink_converter.h"
#include "core/ink_errors.h"
#include "util/ink_file_util.h"
#include "util/logger.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>

namespace ink {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& section, const char* key, T* out) {
  auto it = section.find(key);
  if (it != section.end() && !it->is_null()) {
    *out = it->get<T>();
  }
}

void ReadPageSettings(const json& page, PageSettings* settings) {
  auto format_it = page.find("paper_format");
  if (format_it != page.end()) {
    PaperFormat format;
    if (!ParsePaperFormat(format_it->get<std::string>(), &format)) {
      throw ConfigurationError("Unknown paper format '" + format_it->get<std::string>() + "'");
    }
    settings->SetPaperFormat(format);
  }
  ReadKey(page, "paper_width", &settings->paper_width);
  ReadKey(page, "paper_height", &settings->paper_height);
  ReadKey(page, "landscape", &settings->landscape);
  ReadKey(page, "display_header_footer", &settings->display_header_footer);
  ReadKey(page, "print_background", &settings->print_background);
  ReadKey(page, "scale", &settings->scale);
  ReadKey(page, "margin_top", &settings->margin_top);
  ReadKey(page, "margin_bottom", &settings->margin_bottom);
  ReadKey(page, "margin_left", &settings->margin_left);
  ReadKey(page, "margin_right", &settings->margin_right);
  ReadKey(page, "page_ranges", &settings->page_ranges);
  ReadKey(page, "header_template", &settings->header_template);
  ReadKey(page, "footer_template", &settings->footer_template);
  ReadKey(page, "prefer_css_page_size", &settings->prefer_css_page_size);

  auto grayscale_it = page.find("grayscale");
  if (grayscale_it != page.end() && grayscale_it->get<bool>()) {
    settings->color_mode = ColorMode::GRAYSCALE;
  }
}

}  // namespace

int64_t ParseConfigInt(const std::string& text, const std::string& what) {
  if (text.empty() || text.size() > 18) {
    throw ConfigurationError("Invalid number for " + what + ": '" + text + "'");
  }
  size_t start = text[0] == '-' ? 1 : 0;
  if (start == text.size()) {
    throw ConfigurationError("Invalid number for " + what + ": '" + text + "'");
  }
  for (size_t i = start; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw ConfigurationError("Invalid number for " + what + ": '" + text + "'");
    }
  }
  return std::stoll(text);
}

std::vector<std::string> SplitList(const std::string& text, char separator) {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(separator, start);
    if (end == std::string::npos) end = text.size();
    std::string item = text.substr(start, end - start);
    size_t first = item.find_first_not_of(" \t");
    size_t last = item.find_last_not_of(" \t");
    if (first != std::string::npos) {
      items.push_back(item.substr(first, last - first + 1));
    }
    start = end + 1;
  }
  return items;
}

void Config::LoadFile(const std::string& path) {
  std::string text;
  if (!ReadFile(path, &text)) {
    throw ConfigurationError("Could not read the config file '" + path + "'");
  }

  json root = json::parse(text, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    throw ConfigurationError("The config file '" + path + "' is not a JSON object");
  }

  try {
    auto chrome = root.value("chrome", json::object());
    ReadKey(chrome, "path", &chrome_path);
    ReadKey(chrome, "user_profile", &user_profile);
    ReadKey(chrome, "arguments", &chrome_arguments);
    ReadKey(chrome, "proxy_server", &proxy_server);
    ReadKey(chrome, "proxy_bypass_list", &proxy_bypass_list);
    ReadKey(chrome, "proxy_pac_url", &proxy_pac_url);
    ReadKey(chrome, "user_agent", &user_agent);
    ReadKey(chrome, "disk_cache_dir", &disk_cache_dir);
    ReadKey(chrome, "disk_cache_size_mb", &disk_cache_size_mb);
    ReadKey(chrome, "window_width", &window_width);
    ReadKey(chrome, "window_height", &window_height);
    ReadKey(chrome, "run_as_user", &run_as_user);

    auto conversion = root.value("conversion", json::object());
    ReadKey(conversion, "timeout_ms", &conversion_timeout_ms);
    ReadKey(conversion, "media_load_timeout_ms", &media_load_timeout_ms);
    ReadKey(conversion, "wait_for_window_status", &wait_for_window_status);
    ReadKey(conversion, "wait_for_window_status_timeout_ms", &wait_for_window_status_timeout_ms);
    ReadKey(conversion, "url_blacklist", &url_blacklist);
    ReadKey(conversion, "pre_wrap_extensions", &pre_wrap_extensions);
    ReadKey(conversion, "run_javascript", &run_javascript);
    ReadKey(conversion, "capture_snapshot", &capture_snapshot);
    ReadKey(conversion, "log_network_traffic", &log_network_traffic);
    ReadKey(conversion, "use_cache", &use_cache);
    ReadKey(conversion, "temp_dir", &temp_dir);
    ReadKey(conversion, "keep_temp_dir", &keep_temp_dir);

    auto page = root.value("page", json::object());
    ReadPageSettings(page, &page_settings);

    auto logging = root.value("logging", json::object());
    ReadKey(logging, "level", &log_level);
    ReadKey(logging, "file", &log_file);
  } catch (const json::exception& e) {
    throw ConfigurationError("Invalid value in config file '" + path + "': " + e.what());
  }
}

void Config::LoadEnvironment() {
  const char* value;
  if ((value = getenv("INK_CHROME_PATH")) && *value) chrome_path = value;
  if ((value = getenv("INK_USER_PROFILE")) && *value) user_profile = value;
  if ((value = getenv("INK_CONVERSION_TIMEOUT_MS")) && *value) {
    conversion_timeout_ms = ParseConfigInt(value, "INK_CONVERSION_TIMEOUT_MS");
  }
  if ((value = getenv("INK_TEMP_DIR")) && *value) temp_dir = value;
  if ((value = getenv("INK_LOG_FILE")) && *value) log_file = value;
  if ((value = getenv("INK_LOG_LEVEL")) && *value) log_level = value;
}

void Config::Validate() const {
  if (conversion_timeout_ms < 0) {
    throw ConfigurationError("The conversion timeout can not be negative");
  }
  if (media_load_timeout_ms < 0) {
    throw ConfigurationError("The media load timeout can not be negative");
  }
  if (wait_for_window_status_timeout_ms <= 0) {
    throw ConfigurationError("The window status timeout has to be greater than zero");
  }
  if (window_width <= 0 || window_height <= 0) {
    throw ConfigurationError("Window width and height have to be greater than zero");
  }
  if (disk_cache_size_mb < 0) {
    throw ConfigurationError("The disk cache size can not be negative");
  }
  if (!user_profile.empty() && !DirectoryExists(user_profile)) {
    throw ConfigurationError("The directory '" + user_profile + "' does not exists");
  }
  if (!temp_dir.empty() && !DirectoryExists(temp_dir)) {
    throw ConfigurationError("The directory '" + temp_dir + "' does not exists");
  }
  page_settings.Validate();
}

void Config::InitLogging() const {
  if (log_file.empty()) {
    InkLogger::Logger::Init();
  } else {
    InkLogger::Logger::Init(log_file);
  }
  InkLogger::Level level = InkLogger::Logger::ParseLevel(log_level, InkLogger::DEBUG);
  if (level != InkLogger::Logger::ParseLevel(log_level, InkLogger::ERROR)) {
    LOG_WARN("Config", "Unknown log level '" + log_level + "', using info");
    level = InkLogger::INFO;
  }
  InkLogger::Logger::SetLevel(level);
}

std::unique_ptr<Converter> Config::CreateConverter() const {
  std::unique_ptr<Converter> converter(new Converter(chrome_path, user_profile));
  ApplyTo(*converter);
  return converter;
}

void Config::ApplyTo(Converter& converter) const {
  for (const auto& argument : chrome_arguments) {
    size_t equals = argument.find('=');
    if (equals == std::string::npos) {
      converter.AddChromeArgument(argument);
    } else {
      converter.AddChromeArgument(argument.substr(0, equals), argument.substr(equals + 1));
    }
  }
  if (!proxy_server.empty()) converter.SetProxyServer(proxy_server);
  if (!proxy_bypass_list.empty()) converter.SetProxyBypassList(proxy_bypass_list);
  if (!proxy_pac_url.empty()) converter.SetProxyPacUrl(proxy_pac_url);
  if (!user_agent.empty()) converter.SetUserAgent(user_agent);
  converter.SetWindowSize(window_width, window_height);
  if (!run_as_user.empty()) converter.SetUser(run_as_user);

  converter.SetDiskCacheDisabled(!use_cache);
  if (!disk_cache_dir.empty()) {
    std::optional<int64_t> size;
    if (disk_cache_size_mb > 0) size = disk_cache_size_mb;
    converter.SetDiskCache(disk_cache_dir, size);
  }

  converter.SetUrlBlacklist(url_blacklist);
  converter.SetPreWrapExtensions(pre_wrap_extensions);
  converter.SetRunJavascript(run_javascript);
  converter.SetCaptureSnapshot(capture_snapshot);
  converter.SetLogNetworkTraffic(log_network_traffic);
  converter.SetTempDirectory(temp_dir);
  converter.SetKeepTempDirectory(keep_temp_dir);
}

ConversionOptions Config::ToConversionOptions() const {
  ConversionOptions options;
  options.page_settings = page_settings;
  options.wait_for_window_status = wait_for_window_status;
  options.wait_for_window_status_timeout_ms = wait_for_window_status_timeout_ms;
  if (conversion_timeout_ms > 0) options.conversion_timeout_ms = conversion_timeout_ms;
  if (media_load_timeout_ms > 0) options.media_load_timeout_ms = media_load_timeout_ms;
  return options;
}

}  // namespace ink
