#pragma once

#include "core/ink_browser.h"
#include "core/ink_chrome_arguments.h"
#include "core/ink_chrome_process.h"
#include "core/ink_document_transformers.h"
#include "core/ink_page_settings.h"
#include "core/ink_url_blacklist.h"
#include "network/ink_transport.h"
#include "util/ink_countdown_timer.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace ink {

class TempDirectory;

// What to convert
struct ConvertTarget {
  enum class Kind {
    URL,
    FILE,
    HTML  // Raw markup, loaded with Page.setDocumentContent
  };

  Kind kind = Kind::URL;
  std::string value;

  static ConvertTarget Url(const std::string& url) { return {Kind::URL, url}; }
  static ConvertTarget File(const std::string& path) { return {Kind::FILE, path}; }
  static ConvertTarget Html(const std::string& markup) { return {Kind::HTML, markup}; }
};

// Per conversion settings
struct ConversionOptions {
  PageSettings page_settings;

  // Wait until window.status equals this before rendering. The conversion
  // countdown is paused during the wait.
  std::string wait_for_window_status;
  int64_t wait_for_window_status_timeout_ms = 60000;

  // Budget for the whole conversion, >= 1 ms
  std::optional<int64_t> conversion_timeout_ms;

  // Extra bound on the load event once DOMContentLoaded fired
  std::optional<int64_t> media_load_timeout_ms;
};

// Converts web pages, files and markup to PDF or PNG with a headless
// browser.
//
// The browser is started by the first conversion and reused by the
// following ones until Dispose(). Conversions on one converter are
// serialized.
class Converter {
 public:
  // An empty executable is searched with FindChromeExecutable(). A user
  // profile directory selects the named-profile mode and must exist.
  // Throws ConfigurationError.
  explicit Converter(const std::string& chrome_executable = "",
                     const std::string& user_profile_dir = "");
  ~Converter();

  Converter(const Converter&) = delete;
  Converter& operator=(const Converter&) = delete;

  // Browser flags. All of these throw ConfigurationError while the browser
  // is running.
  void ResetChromeArguments();
  void AddChromeArgument(const std::string& flag);
  void AddChromeArgument(const std::string& name, const std::string& value);
  void RemoveChromeArgument(const std::string& flag);
  std::vector<std::string> DefaultChromeArguments() const;

  void SetProxyServer(const std::string& value);
  void SetProxyBypassList(const std::string& values);
  void SetProxyPacUrl(const std::string& value);
  void SetUserAgent(const std::string& value);
  void SetDiskCache(const std::string& directory, std::optional<int64_t> size_mb);
  void SetWindowSize(int width, int height);
  void SetWindowSize(WindowSize size);

  // Run the browser as another account (POSIX: only when running as root).
  // Password and domain are not used on this platform.
  void SetUser(const std::string& user_name, const std::string& password = "",
               const std::string& domain = "");

  // '*' wildcard patterns for URLs the browser may not load
  void SetUrlBlacklist(const std::vector<std::string>& patterns);

  // Extensions (".txt") of text files wrapped in <pre> before loading
  void SetPreWrapExtensions(const std::vector<std::string>& extensions);
  const std::vector<std::string>& pre_wrap_extensions() const { return pre_wrap_extensions_; }

  // Base directory for per-conversion scratch directories; must exist
  void SetTempDirectory(const std::string& directory);
  void SetKeepTempDirectory(bool keep) { keep_temp_directory_ = keep; }
  // Scratch directory of the current or last conversion, empty when none
  const std::string& current_temp_directory() const { return current_temp_directory_; }

  void SetSanitizeHtml(bool sanitize) { sanitize_html_ = sanitize; }
  void SetImageResize(bool resize) { image_resize_ = resize; }
  void SetImageRotate(bool rotate) { image_rotate_ = rotate; }
  void SetImageLoadTimeout(int64_t timeout_ms) { image_load_timeout_ms_ = timeout_ms; }

  void SetSanitizer(std::shared_ptr<Sanitizer> sanitizer) { sanitizer_ = std::move(sanitizer); }
  void SetImageTransformer(std::shared_ptr<ImageTransformer> transformer) { image_transformer_ = std::move(transformer); }
  void SetContentFitTransformer(std::shared_ptr<ContentFitTransformer> transformer) { content_fit_transformer_ = std::move(transformer); }

  // Script run after loading and before rendering
  void SetRunJavascript(const std::string& script) { run_javascript_ = script; }

  // MHTML snapshot taken before rendering. Stream conversions write it to
  // the snapshot stream; file conversions next to the output file.
  void SetCaptureSnapshot(bool capture) { capture_snapshot_ = capture; }
  void SetSnapshotStream(std::ostream* stream) { snapshot_stream_ = stream; }

  void SetLogNetworkTraffic(bool log) { log_network_traffic_ = log; }

  void SetDiskCacheDisabled(bool disabled) { use_cache_ = !disabled; }
  bool disk_cache_disabled() const { return !use_cache_; }

  void SetInstanceId(const std::string& id);
  const std::string& instance_id() const { return instance_id_; }

  // Replaces the WebSocket connection to the browser
  void SetTransportFactory(TransportFactory factory) { transport_factory_ = std::move(factory); }

  void ConvertToPdf(const ConvertTarget& target, std::ostream& output,
                    const ConversionOptions& options = ConversionOptions());
  void ConvertToPdf(const ConvertTarget& target, const std::string& output_file,
                    const ConversionOptions& options = ConversionOptions());
  void ConvertToImage(const ConvertTarget& target, std::ostream& output,
                      const ConversionOptions& options = ConversionOptions());
  void ConvertToImage(const ConvertTarget& target, const std::string& output_file,
                      const ConversionOptions& options = ConversionOptions());

  bool IsChromeRunning();

  // Closes the connections and stops the browser. Idempotent.
  void Dispose();

 private:
  enum class OutputFormat {
    PDF,
    IMAGE
  };

  void Convert(OutputFormat format, const ConvertTarget& target, std::ostream& output,
               std::ostream* snapshot, const ConversionOptions& options);
  void ConvertToFile(OutputFormat format, const ConvertTarget& target,
                     const std::string& output_file, const ConversionOptions& options);

  void ValidateTarget(const ConvertTarget& target) const;
  void ValidateCollaborators(const ConversionOptions& options) const;
  std::string PreProcess(const ConvertTarget& target, const ConversionOptions& options,
                         std::set<std::string>* safe_urls,
                         std::unique_ptr<TempDirectory>* temp_dir);
  void EnsureRunning(const CountdownTimer* timer);
  void CaptureSnapshot(std::ostream* sink, const CountdownTimer* timer);
  void Render(OutputFormat format, const ConversionOptions& options, std::ostream& output,
              const CountdownTimer* timer);
  void ThrowIfRunning(const std::string& what);
  void CheckOutputDirectory(const std::string& output_file) const;
  std::string LogComponent() const { return "Converter:" + instance_id_; }

  std::string chrome_executable_;
  std::string user_profile_dir_;
  ChromeArguments arguments_;
  std::string run_as_user_;
  bool use_cache_ = false;

  UrlBlacklist url_blacklist_;
  std::vector<std::string> pre_wrap_extensions_;
  std::string temp_directory_;
  bool keep_temp_directory_ = false;
  std::string current_temp_directory_;

  bool sanitize_html_ = false;
  bool image_resize_ = false;
  bool image_rotate_ = false;
  int64_t image_load_timeout_ms_ = -1;
  std::shared_ptr<Sanitizer> sanitizer_;
  std::shared_ptr<ImageTransformer> image_transformer_;
  std::shared_ptr<ContentFitTransformer> content_fit_transformer_;

  std::string run_javascript_;
  bool capture_snapshot_ = false;
  std::ostream* snapshot_stream_ = nullptr;
  bool log_network_traffic_ = false;
  std::string instance_id_;

  TransportFactory transport_factory_;
  std::unique_ptr<ChromeProcess> process_;
  std::unique_ptr<Browser> browser_;

  std::mutex conversion_mutex_;
};

}  // namespace ink
