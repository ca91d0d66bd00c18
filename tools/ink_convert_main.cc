#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <iostream>
#include <string>

#include "core/ink_converter.h"
#include "core/ink_errors.h"
#include "util/ink_config.h"
#include "util/logger.h"

namespace {

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS] --output FILE (--url URL | --input FILE | --html FILE)\n\n";
  std::cout << "Input:\n";
  std::cout << "  --url URL                  Web page to convert\n";
  std::cout << "  --input FILE               Local file to convert (.html, or a pre-wrapped text file)\n";
  std::cout << "  --html FILE                Load the markup of FILE as document content\n";
  std::cout << "\n";
  std::cout << "Output:\n";
  std::cout << "  --output FILE              Destination file\n";
  std::cout << "  --format FORMAT            pdf or png (default: pdf)\n";
  std::cout << "  --snapshot                 Also write an MHTML snapshot next to the output\n";
  std::cout << "\n";
  std::cout << "Configuration:\n";
  std::cout << "  --config FILE              JSON configuration file\n";
  std::cout << "  --chrome-path PATH         Chrome or Chromium executable\n";
  std::cout << "  --user-profile DIR         Use this profile directory\n";
  std::cout << "  --chrome-arg FLAG          Extra browser flag, repeatable (--name or --name=value)\n";
  std::cout << "  --proxy-server VALUE       Proxy server for the browser\n";
  std::cout << "  --user-agent VALUE         User agent string\n";
  std::cout << "  --window-size WxH          Window size or preset name (default: 1366x768)\n";
  std::cout << "  --timeout MS               Budget for the whole conversion\n";
  std::cout << "  --media-load-timeout MS    Max wait for the load event after DOMContentLoaded\n";
  std::cout << "  --window-status VALUE      Wait until window.status equals VALUE\n";
  std::cout << "  --window-status-timeout MS Bound on the window.status wait (default: 60000)\n";
  std::cout << "  --blacklist PATTERNS       Comma separated '*' url patterns to block\n";
  std::cout << "  --pre-wrap EXTENSIONS      Comma separated extensions to wrap in <pre>\n";
  std::cout << "  --run-javascript SCRIPT    Script to run before rendering\n";
  std::cout << "  --temp-dir DIR             Base directory for scratch files\n";
  std::cout << "  --keep-temp-dir            Do not delete the scratch directory\n";
  std::cout << "  --log-network-traffic      Log requests and responses\n";
  std::cout << "  --log-level LEVEL          debug, info, warn or error (default: info)\n";
  std::cout << "  --log-file FILE            Also append log lines to FILE\n";
  std::cout << "\n";
  std::cout << "Page:\n";
  std::cout << "  --paper-format NAME        Letter, Legal, Tabloid, Ledger, A0 .. A6\n";
  std::cout << "  --landscape                Landscape orientation\n";
  std::cout << "  --print-background         Print background graphics\n";
  std::cout << "  --grayscale                Render in grayscale\n";
  std::cout << "  --scale FACTOR             Scale factor, 0.1 to 2\n";
  std::cout << "  --margins INCHES           All four margins\n";
  std::cout << "  --page-ranges RANGES       e.g. 1-5, 8, 11-13\n";
  std::cout << "  --help                     Show this help message\n";
  std::cout << "\n";
  std::cout << "Environment variables INK_CHROME_PATH, INK_USER_PROFILE, INK_CONVERSION_TIMEOUT_MS,\n";
  std::cout << "INK_TEMP_DIR, INK_LOG_FILE and INK_LOG_LEVEL override the config file; options\n";
  std::cout << "override both.\n";
}

double ParseDouble(const std::string& text, const std::string& what) {
  size_t used = 0;
  double value = 0;
  try {
    value = std::stod(text, &used);
  } catch (const std::logic_error&) {
    used = 0;
  }
  if (used == 0 || used != text.size()) {
    throw ink::ConfigurationError("Invalid number for " + what + ": '" + text + "'");
  }
  return value;
}

}  // namespace

int main(int argc, char* argv[]) {
  ink::Config config;
  std::string url;
  std::string input_file;
  std::string html_file;
  std::string output_file;
  std::string format = "pdf";

  try {
    // The config file is loaded first so environment and options override it
    for (int i = 1; i < argc; i++) {
      if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
        config.LoadFile(argv[i + 1]);
      }
    }
    config.LoadEnvironment();

    for (int i = 1; i < argc; i++) {
      std::string arg = argv[i];
      bool has_value = i + 1 < argc;

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--config" && has_value) {
        ++i;
      } else if (arg == "--url" && has_value) {
        url = argv[++i];
      } else if (arg == "--input" && has_value) {
        input_file = argv[++i];
      } else if (arg == "--html" && has_value) {
        html_file = argv[++i];
      } else if (arg == "--output" && has_value) {
        output_file = argv[++i];
      } else if (arg == "--format" && has_value) {
        format = argv[++i];
      } else if (arg == "--snapshot") {
        config.capture_snapshot = true;
      } else if (arg == "--chrome-path" && has_value) {
        config.chrome_path = argv[++i];
      } else if (arg == "--user-profile" && has_value) {
        config.user_profile = argv[++i];
      } else if (arg == "--chrome-arg" && has_value) {
        config.chrome_arguments.push_back(argv[++i]);
      } else if (arg == "--proxy-server" && has_value) {
        config.proxy_server = argv[++i];
      } else if (arg == "--user-agent" && has_value) {
        config.user_agent = argv[++i];
      } else if (arg == "--window-size" && has_value) {
        std::string size = argv[++i];
        if (!ink::ParseWindowSize(size, &config.window_width, &config.window_height)) {
          throw ink::ConfigurationError("Invalid window size '" + size + "'");
        }
      } else if (arg == "--timeout" && has_value) {
        config.conversion_timeout_ms = ink::ParseConfigInt(argv[++i], "--timeout");
      } else if (arg == "--media-load-timeout" && has_value) {
        config.media_load_timeout_ms = ink::ParseConfigInt(argv[++i], "--media-load-timeout");
      } else if (arg == "--window-status" && has_value) {
        config.wait_for_window_status = argv[++i];
      } else if (arg == "--window-status-timeout" && has_value) {
        config.wait_for_window_status_timeout_ms =
            ink::ParseConfigInt(argv[++i], "--window-status-timeout");
      } else if (arg == "--blacklist" && has_value) {
        config.url_blacklist = ink::SplitList(argv[++i]);
      } else if (arg == "--pre-wrap" && has_value) {
        config.pre_wrap_extensions = ink::SplitList(argv[++i]);
      } else if (arg == "--run-javascript" && has_value) {
        config.run_javascript = argv[++i];
      } else if (arg == "--temp-dir" && has_value) {
        config.temp_dir = argv[++i];
      } else if (arg == "--keep-temp-dir") {
        config.keep_temp_dir = true;
      } else if (arg == "--log-network-traffic") {
        config.log_network_traffic = true;
      } else if (arg == "--log-level" && has_value) {
        config.log_level = argv[++i];
      } else if (arg == "--log-file" && has_value) {
        config.log_file = argv[++i];
      } else if (arg == "--paper-format" && has_value) {
        std::string name = argv[++i];
        ink::PaperFormat paper_format;
        if (!ink::ParsePaperFormat(name, &paper_format)) {
          throw ink::ConfigurationError("Unknown paper format '" + name + "'");
        }
        config.page_settings.SetPaperFormat(paper_format);
      } else if (arg == "--landscape") {
        config.page_settings.landscape = true;
      } else if (arg == "--print-background") {
        config.page_settings.print_background = true;
      } else if (arg == "--grayscale") {
        config.page_settings.color_mode = ink::ColorMode::GRAYSCALE;
      } else if (arg == "--scale" && has_value) {
        config.page_settings.scale = ParseDouble(argv[++i], "--scale");
      } else if (arg == "--margins" && has_value) {
        double margin = ParseDouble(argv[++i], "--margins");
        config.page_settings.margin_top = margin;
        config.page_settings.margin_bottom = margin;
        config.page_settings.margin_left = margin;
        config.page_settings.margin_right = margin;
      } else if (arg == "--page-ranges" && has_value) {
        config.page_settings.page_ranges = argv[++i];
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        PrintUsage(argv[0]);
        return 3;
      }
    }
  } catch (const ink::InkError& e) {
    std::cerr << "[FATAL] " << e.code() << ": " << e.what() << std::endl;
    return 2;
  }

  int inputs = (url.empty() ? 0 : 1) + (input_file.empty() ? 0 : 1) + (html_file.empty() ? 0 : 1);
  if (inputs != 1 || output_file.empty()) {
    std::cerr << "Exactly one of --url, --input or --html and an --output are required" << std::endl;
    PrintUsage(argv[0]);
    return 3;
  }
  if (format != "pdf" && format != "png") {
    std::cerr << "Unknown format: " << format << std::endl;
    return 3;
  }

  std::unique_ptr<ink::Converter> converter;
  try {
    config.Validate();
    config.InitLogging();
    converter = config.CreateConverter();
  } catch (const ink::InkError& e) {
    std::cerr << "[FATAL] " << e.code() << ": " << e.what() << std::endl;
    return 2;
  }

  ink::ConvertTarget target = ink::ConvertTarget::Url(url);
  if (!input_file.empty()) {
    target = ink::ConvertTarget::File(input_file);
  } else if (!html_file.empty()) {
    std::ifstream html(html_file, std::ios::binary);
    if (!html) {
      std::cerr << "[FATAL] Could not read the file '" << html_file << "'" << std::endl;
      return 2;
    }
    std::string markup((std::istreambuf_iterator<char>(html)), std::istreambuf_iterator<char>());
    target = ink::ConvertTarget::Html(markup);
  }

  int exit_code = 0;
  try {
    ink::ConversionOptions options = config.ToConversionOptions();
    if (format == "pdf") {
      converter->ConvertToPdf(target, output_file, options);
    } else {
      converter->ConvertToImage(target, output_file, options);
    }
    LOG_INFO("ink_convert", "Wrote '" + output_file + "'");
  } catch (const ink::InkError& e) {
    std::cerr << "[ERROR] " << e.code() << ": " << e.what() << std::endl;
    exit_code = 1;
  }

  converter->Dispose();
  return exit_code;
}
