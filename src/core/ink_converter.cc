#include "core/ink_converter.h"
#include "core/ink_chrome_finder.h"
#include "core/ink_errors.h"
#include "core/ink_navigator.h"
#include "core/ink_pre_wrapper.h"
#include "util/ink_encoding.h"
#include "util/ink_file_util.h"
#include "util/ink_temp_directory.h"
#include "util/logger.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unistd.h>

namespace ink {

namespace {

const char* kNativeExtensions[] = {".htm", ".html", ".mht", ".mhtml", ".svg", ".xml"};

const char* kGrayscaleScript =
    "document.documentElement.style.filter = 'grayscale(100%)';";

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

const char* FormatName(bool pdf) {
  return pdf ? "PDF" : "image";
}

// Closes the conversion's page target however the conversion ends
class PageScope {
 public:
  explicit PageScope(Browser* browser) : browser_(browser) {}
  ~PageScope() { browser_->ClosePage(); }

  PageScope(const PageScope&) = delete;
  PageScope& operator=(const PageScope&) = delete;

 private:
  Browser* browser_;
};

}  // namespace

Converter::Converter(const std::string& chrome_executable, const std::string& user_profile_dir)
    : instance_id_(GenerateUuid()) {
  chrome_executable_ = chrome_executable.empty() ? FindChromeExecutable() : chrome_executable;
  if (chrome_executable_.empty()) {
    throw ConfigurationError("Could not find a Chrome or Chromium executable, set its path explicitly");
  }
  if (access(chrome_executable_.c_str(), X_OK) != 0) {
    throw ConfigurationError("Could not find chrome in location '" + chrome_executable_ + "'");
  }

  if (!user_profile_dir.empty()) {
    if (!DirectoryExists(user_profile_dir)) {
      throw ConfigurationError("The directory '" + user_profile_dir + "' does not exists");
    }
    user_profile_dir_ = AbsolutePath(user_profile_dir);
  }

  ResetChromeArguments();
}

Converter::~Converter() {
  Dispose();
}

void Converter::SetInstanceId(const std::string& id) {
  instance_id_ = id.empty() ? GenerateUuid() : id;
}

void Converter::ThrowIfRunning(const std::string& what) {
  if (IsChromeRunning()) {
    throw ConfigurationError("Chrome is already running, you need to set '" + what +
                             "' before starting Chrome");
  }
}

void Converter::ResetChromeArguments() {
  ThrowIfRunning("the default arguments");
  LOG_INFO(LogComponent(), "Resetting Chrome arguments to default");
  arguments_.Reset();
  if (!user_profile_dir_.empty()) {
    arguments_.Add("--user-data-dir", user_profile_dir_);
  }
  use_cache_ = false;
}

void Converter::AddChromeArgument(const std::string& flag) {
  ThrowIfRunning(flag);
  arguments_.Add(flag);
}

void Converter::AddChromeArgument(const std::string& name, const std::string& value) {
  ThrowIfRunning(name);
  arguments_.Add(name, value);
}

void Converter::RemoveChromeArgument(const std::string& flag) {
  ThrowIfRunning(flag);
  if (arguments_.Remove(flag)) {
    LOG_INFO(LogComponent(), "Removed Chrome argument '" + flag + "'");
  }
}

std::vector<std::string> Converter::DefaultChromeArguments() const {
  return arguments_.ToDisplayList();
}

void Converter::SetProxyServer(const std::string& value) {
  AddChromeArgument("--proxy-server", value);
}

void Converter::SetProxyBypassList(const std::string& values) {
  AddChromeArgument("--proxy-bypass-list", values);
}

void Converter::SetProxyPacUrl(const std::string& value) {
  AddChromeArgument("--proxy-pac-url", value);
}

void Converter::SetUserAgent(const std::string& value) {
  AddChromeArgument("--user-agent", value);
}

void Converter::SetDiskCache(const std::string& directory, std::optional<int64_t> size_mb) {
  if (!DirectoryExists(directory)) {
    throw ConfigurationError("The directory '" + directory + "' does not exists");
  }
  if (size_mb && *size_mb <= 0) {
    throw ConfigurationError("The disk cache size has to be a value of 1 or greater");
  }

  std::string trimmed = directory;
  while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
  AddChromeArgument("--disk-cache-dir", trimmed);
  if (size_mb) {
    AddChromeArgument("--disk-cache-size", std::to_string(*size_mb * 1024 * 1024));
  }
  use_cache_ = true;
}

void Converter::SetWindowSize(int width, int height) {
  if (width <= 0 || height <= 0) {
    throw ConfigurationError("Window width and height have to be greater than zero");
  }
  AddChromeArgument("--window-size", std::to_string(width) + "," + std::to_string(height));
}

void Converter::SetWindowSize(WindowSize size) {
  int width = 0;
  int height = 0;
  WindowSizeToPixels(size, &width, &height);
  SetWindowSize(width, height);
}

void Converter::SetUser(const std::string& user_name, const std::string& password,
                        const std::string& domain) {
  ThrowIfRunning("the user");
  if (!password.empty() || !domain.empty()) {
    LOG_WARN(LogComponent(), "Password and domain are not used on this platform, ignoring them");
  }
  run_as_user_ = user_name;
}

void Converter::SetUrlBlacklist(const std::vector<std::string>& patterns) {
  url_blacklist_.SetPatterns(patterns);
}

void Converter::SetPreWrapExtensions(const std::vector<std::string>& extensions) {
  pre_wrap_extensions_.clear();
  for (const auto& extension : extensions) {
    std::string normalized = ToLower(extension);
    if (!normalized.empty() && normalized[0] != '.') {
      normalized = "." + normalized;
    }
    pre_wrap_extensions_.push_back(normalized);
  }
}

void Converter::SetTempDirectory(const std::string& directory) {
  if (!directory.empty() && !DirectoryExists(directory)) {
    throw ConfigurationError("The directory '" + directory + "' does not exists");
  }
  temp_directory_ = directory;
}

bool Converter::IsChromeRunning() {
  return process_ && process_->IsRunning();
}

void Converter::ConvertToPdf(const ConvertTarget& target, std::ostream& output,
                             const ConversionOptions& options) {
  Convert(OutputFormat::PDF, target, output, snapshot_stream_, options);
}

void Converter::ConvertToPdf(const ConvertTarget& target, const std::string& output_file,
                             const ConversionOptions& options) {
  ConvertToFile(OutputFormat::PDF, target, output_file, options);
}

void Converter::ConvertToImage(const ConvertTarget& target, std::ostream& output,
                               const ConversionOptions& options) {
  Convert(OutputFormat::IMAGE, target, output, snapshot_stream_, options);
}

void Converter::ConvertToImage(const ConvertTarget& target, const std::string& output_file,
                               const ConversionOptions& options) {
  ConvertToFile(OutputFormat::IMAGE, target, output_file, options);
}

void Converter::CheckOutputDirectory(const std::string& output_file) const {
  std::string directory = DirName(output_file);
  if (!DirectoryExists(directory)) {
    throw ConfigurationError("The path '" + directory + "' does not exists");
  }
}

void Converter::ConvertToFile(OutputFormat format, const ConvertTarget& target,
                              const std::string& output_file, const ConversionOptions& options) {
  CheckOutputDirectory(output_file);

  std::ostringstream rendered;
  std::ostringstream snapshot;
  Convert(format, target, rendered, capture_snapshot_ ? &snapshot : nullptr, options);

  if (!WriteFile(output_file, rendered.str())) {
    throw ConversionError("Could not write the output file '" + output_file + "'");
  }
  LOG_INFO(LogComponent(), std::string(FormatName(format == OutputFormat::PDF)) +
           " written to output file '" + output_file + "'");

  if (capture_snapshot_) {
    std::string snapshot_file = ChangeExtension(output_file, ".mhtml");
    if (!WriteFile(snapshot_file, snapshot.str())) {
      throw ConversionError("Could not write the snapshot file '" + snapshot_file + "'");
    }
    LOG_INFO(LogComponent(), "Page snapshot written to output file '" + snapshot_file + "'");
  }
}

void Converter::ValidateTarget(const ConvertTarget& target) const {
  if (target.kind != ConvertTarget::Kind::FILE) {
    if (target.kind == ConvertTarget::Kind::URL && target.value.empty()) {
      throw ConversionError("The url to convert is empty");
    }
    return;
  }

  if (!FileExists(target.value)) {
    throw ConversionError("The file '" + target.value + "' does not exists");
  }

  std::string extension = FileExtension(target.value);
  for (const char* native : kNativeExtensions) {
    if (extension == native) {
      return;
    }
  }
  if (std::find(pre_wrap_extensions_.begin(), pre_wrap_extensions_.end(), extension) ==
      pre_wrap_extensions_.end()) {
    throw ConversionError("The file '" + target.value + "' with extension '" + extension +
                          "' is not valid. If this is a text based file then add the extension "
                          "to the pre-wrap extensions");
  }
}

void Converter::ValidateCollaborators(const ConversionOptions& options) const {
  if (sanitize_html_ && !sanitizer_) {
    throw ConfigurationError("HTML sanitizing is enabled but no sanitizer is set");
  }
  if ((image_resize_ || image_rotate_) && !image_transformer_) {
    throw ConfigurationError("Image resize or rotate is enabled but no image transformer is set");
  }
  if (options.page_settings.paper_format == PaperFormat::FIT_PAGE_TO_CONTENT && !content_fit_transformer_) {
    throw ConfigurationError("The paper format 'FitPageToContent' needs a content fit transformer");
  }
}

std::string Converter::PreProcess(const ConvertTarget& target, const ConversionOptions& options,
                                  std::set<std::string>* safe_urls,
                                  std::unique_ptr<TempDirectory>* temp_dir) {
  auto scratch = [&]() -> const std::string& {
    if (!*temp_dir) {
      temp_dir->reset(new TempDirectory(temp_directory_));
      current_temp_directory_ = (*temp_dir)->path();
      if (keep_temp_directory_) (*temp_dir)->Keep();
    }
    return (*temp_dir)->path();
  };

  std::string url = target.value;
  if (target.kind == ConvertTarget::Kind::FILE) {
    std::string path = AbsolutePath(target.value);
    std::string extension = FileExtension(path);
    if (std::find(pre_wrap_extensions_.begin(), pre_wrap_extensions_.end(), extension) !=
        pre_wrap_extensions_.end()) {
      PreWrapper wrapper(scratch());
      path = wrapper.WrapFile(path);
      url = FileUrl(path);
      LOG_INFO(LogComponent(), "Adding url '" + url + "' to the safe url list");
      safe_urls->insert(url);
    } else {
      url = FileUrl(path);
    }
  }

  if (sanitize_html_) {
    auto sanitized = sanitizer_->Sanitize(url, scratch(), safe_urls);
    if (sanitized) {
      url = *sanitized;
    } else {
      LOG_INFO(LogComponent(), "Adding url '" + url + "' to the safe url list");
    }
    safe_urls->insert(url);
  }

  if (options.page_settings.paper_format == PaperFormat::FIT_PAGE_TO_CONTENT) {
    LOG_INFO(LogComponent(), "The paper format 'FitPageToContent' is set, modifying html so that "
             "the PDF fits the HTML content");
    auto fitted = content_fit_transformer_->FitPageToContent(url, scratch());
    if (fitted) {
      url = *fitted;
      safe_urls->insert(url);
    }
  }

  if (image_resize_ || image_rotate_) {
    ImageTransformOptions image_options;
    image_options.resize = image_resize_;
    image_options.rotate = image_rotate_;
    image_options.page_settings = options.page_settings;
    image_options.image_load_timeout_ms = image_load_timeout_ms_;
    image_options.url_blacklist = url_blacklist_.patterns();
    auto transformed = image_transformer_->Transform(url, image_options, scratch(), safe_urls);
    if (transformed) {
      url = *transformed;
      safe_urls->insert(url);
    }
  }

  return url;
}

void Converter::EnsureRunning(const CountdownTimer* timer) {
  if (process_ && !process_->IsRunning()) {
    LOG_WARN(LogComponent(), "Chrome exited unexpectedly with " + process_->ExitDescription());
    browser_.reset();
    process_.reset();
  }

  if (!process_) {
    ChromeProcessOptions process_options;
    process_options.executable = chrome_executable_;
    process_options.arguments = arguments_.ToArgv();
    process_options.user_profile_dir = user_profile_dir_;
    process_options.run_as_user = run_as_user_;

    std::unique_ptr<ChromeProcess> process(new ChromeProcess(process_options));
    process->Start(-1, timer);
    process_ = std::move(process);
  }

  if (!browser_ || !browser_->IsConnected()) {
    browser_.reset(new Browser(process_->endpoint(), transport_factory_));
    browser_->Connect();
  }
}

void Converter::CaptureSnapshot(std::ostream* sink, const CountdownTimer* timer) {
  if (!sink) {
    throw ConversionError("Capture snapshot is enabled but there is no snapshot stream set");
  }

  LOG_INFO(LogComponent(), "Taking snapshot of the page");
  json result = browser_->page_client().SendCommand("Page.captureSnapshot",
                                                    {{"format", "mhtml"}}, -1, timer);
  std::string data = result.value("data", std::string());
  sink->write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!*sink) {
    throw ConversionError("Could not write the snapshot");
  }
  LOG_INFO(LogComponent(), "Taken");
}

void Converter::Render(OutputFormat format, const ConversionOptions& options, std::ostream& output,
                       const CountdownTimer* timer) {
  DevToolsClient& page = browser_->page_client();
  json result;

  if (format == OutputFormat::PDF) {
    if (options.page_settings.color_mode == ColorMode::GRAYSCALE) {
      page.SendCommand("Runtime.evaluate", {{"expression", kGrayscaleScript}}, -1, timer);
    }
    LOG_INFO(LogComponent(), "Converting to PDF");
    result = page.SendCommand("Page.printToPDF", options.page_settings.ToPrintParams(), -1, timer);
  } else {
    LOG_INFO(LogComponent(), "Converting to image");
    result = page.SendCommand("Page.captureScreenshot", {{"format", "png"}}, -1, timer);
  }

  std::string encoded = result.value("data", std::string());
  std::string bytes;
  if (encoded.empty() || !Base64Decode(encoded, &bytes) || bytes.empty()) {
    throw ConversionError(std::string("The browser returned no ") +
                          FormatName(format == OutputFormat::PDF) + " data");
  }

  output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!output) {
    throw ConversionError("Could not write the output");
  }
}

void Converter::Convert(OutputFormat format, const ConvertTarget& target, std::ostream& output,
                        std::ostream* snapshot, const ConversionOptions& options) {
  std::lock_guard<std::mutex> lock(conversion_mutex_);
  const std::string component = LogComponent();

  if (options.conversion_timeout_ms && *options.conversion_timeout_ms < 1) {
    throw ConfigurationError("The conversion timeout has to be a value equal to 1 or greater");
  }
  if (format == OutputFormat::PDF) {
    options.page_settings.Validate();
  }
  ValidateTarget(target);
  ValidateCollaborators(options);

  std::unique_ptr<CountdownTimer> countdown;
  if (options.conversion_timeout_ms) {
    LOG_INFO(component, "Conversion timeout set to " + std::to_string(*options.conversion_timeout_ms) +
             " milliseconds");
    countdown.reset(new CountdownTimer(*options.conversion_timeout_ms));
    countdown->Start();
  }
  const CountdownTimer* timer = countdown.get();

  current_temp_directory_.clear();
  std::unique_ptr<TempDirectory> temp_dir;
  std::set<std::string> safe_urls;

  try {
    std::string url;
    if (target.kind != ConvertTarget::Kind::HTML) {
      url = PreProcess(target, options, &safe_urls, &temp_dir);
    }

    EnsureRunning(timer);
    PageScope page_scope(browser_.get());
    browser_->OpenPage(timer);
    Navigator navigator(browser_->page_client(), component);

    if (target.kind == ConvertTarget::Kind::HTML) {
      navigator.SetDocumentContent(target.value, timer);
    } else {
      LOG_INFO(component, (target.kind == ConvertTarget::Kind::FILE ? "Loading file " : "Loading url ") + url);
      NavigationOptions navigation;
      navigation.use_cache = use_cache_;
      navigation.media_load_timeout_ms = options.media_load_timeout_ms.value_or(-1);
      navigation.blacklist = url_blacklist_;
      navigation.safe_urls = safe_urls;
      navigation.log_network_traffic = log_network_traffic_;
      navigator.NavigateTo(url, navigation, timer);
    }

    if (!options.wait_for_window_status.empty()) {
      if (countdown) {
        LOG_INFO(component, "Conversion timeout paused because we are waiting for a window.status");
        countdown->Stop();
      }
      LOG_INFO(component, "Waiting for window.status '" + options.wait_for_window_status +
               "' or a timeout of " + std::to_string(options.wait_for_window_status_timeout_ms) +
               " milliseconds");
      bool match = navigator.WaitForWindowStatus(options.wait_for_window_status,
                                                 options.wait_for_window_status_timeout_ms);
      LOG_INFO(component, match ? "Window status equaled " + options.wait_for_window_status
                                : std::string("Waiting timed out"));
      if (countdown) {
        LOG_INFO(component, "Conversion timeout started again because we are done waiting for a window.status");
        countdown->Start();
      }
    }

    if (!run_javascript_.empty()) {
      LOG_INFO(component, "Start running javascript");
      navigator.RunJavascript(run_javascript_, timer);
      LOG_INFO(component, "Done running javascript");
    }

    if (capture_snapshot_) {
      CaptureSnapshot(snapshot, timer);
    }

    Render(format, options, output, timer);
    LOG_INFO(component, "Converted");
  } catch (const ProtocolTimeoutError& e) {
    LOG_ERROR(component, std::string("Error: ") + e.what());
    if (e.countdown_expired()) {
      throw ConversionTimeoutError("The conversion did not finish within " +
                                   std::to_string(*options.conversion_timeout_ms) +
                                   " milliseconds: " + e.what());
    }
    throw;
  } catch (const InkError& e) {
    LOG_ERROR(component, std::string("Error: ") + e.what());
    throw;
  }
}

void Converter::Dispose() {
  std::lock_guard<std::mutex> lock(conversion_mutex_);

  if (browser_) {
    browser_->Close();
    browser_.reset();
  }

  if (process_) {
    LOG_INFO(LogComponent(), "Stopping Chrome");
    process_->Dispose();
    process_.reset();
    LOG_INFO(LogComponent(), "Chrome stopped");
  }
}

}  // namespace ink
