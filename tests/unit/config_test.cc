#include "core/ink_converter.h"
#include "core/ink_errors.h"
#include "test_helpers.h"
#include "util/ink_config.h"
#include "util/ink_file_util.h"
#include "util/ink_temp_directory.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>

namespace ink {
namespace {

class ConfigTest : public ::testing::Test {
 protected:
  ConfigTest() : scratch_("") {}

  void SetUp() override {
    for (const char* name : {"INK_CHROME_PATH", "INK_USER_PROFILE", "INK_CONVERSION_TIMEOUT_MS",
                             "INK_TEMP_DIR", "INK_LOG_FILE", "INK_LOG_LEVEL"}) {
      unsetenv(name);
    }
  }

  std::string WriteConfig(const std::string& text) {
    std::string path = scratch_.path() + "/inkwell.json";
    EXPECT_TRUE(WriteFile(path, text));
    return path;
  }

  TempDirectory scratch_;
};

TEST_F(ConfigTest, DefaultsValidate) {
  Config config;
  EXPECT_NO_THROW(config.Validate());
  EXPECT_EQ(config.window_width, kDefaultWindowWidth);
  EXPECT_EQ(config.log_level, "info");

  ConversionOptions options = config.ToConversionOptions();
  EXPECT_FALSE(options.conversion_timeout_ms);
  EXPECT_FALSE(options.media_load_timeout_ms);
  EXPECT_EQ(options.wait_for_window_status_timeout_ms, kDefaultWindowStatusTimeoutMs);
}

TEST_F(ConfigTest, LoadsNestedSections) {
  Config config;
  config.LoadFile(WriteConfig(R"({
    "chrome": {
      "path": "/opt/chrome/chrome",
      "arguments": ["--disable-web-security", "--lang=nl"],
      "proxy_server": "http://proxy:3128",
      "window_width": 1920,
      "window_height": 1080
    },
    "conversion": {
      "timeout_ms": 30000,
      "media_load_timeout_ms": 5000,
      "wait_for_window_status": "ready",
      "url_blacklist": ["*.doubleclick.net/*"],
      "pre_wrap_extensions": [".txt", ".log"],
      "capture_snapshot": true
    },
    "page": {
      "paper_format": "A4",
      "landscape": true,
      "margin_top": 1.0,
      "grayscale": true
    },
    "logging": {"level": "debug"}
  })"));

  EXPECT_EQ(config.chrome_path, "/opt/chrome/chrome");
  EXPECT_EQ(config.chrome_arguments.size(), 2u);
  EXPECT_EQ(config.window_width, 1920);
  EXPECT_EQ(config.conversion_timeout_ms, 30000);
  EXPECT_EQ(config.url_blacklist[0], "*.doubleclick.net/*");
  EXPECT_TRUE(config.capture_snapshot);
  EXPECT_EQ(config.page_settings.paper_format, PaperFormat::A4);
  EXPECT_DOUBLE_EQ(config.page_settings.paper_width, 8.27);
  EXPECT_TRUE(config.page_settings.landscape);
  EXPECT_DOUBLE_EQ(config.page_settings.margin_top, 1.0);
  EXPECT_EQ(config.page_settings.color_mode, ColorMode::GRAYSCALE);
  EXPECT_EQ(config.log_level, "debug");

  ConversionOptions options = config.ToConversionOptions();
  ASSERT_TRUE(options.conversion_timeout_ms);
  EXPECT_EQ(*options.conversion_timeout_ms, 30000);
  EXPECT_EQ(*options.media_load_timeout_ms, 5000);
  EXPECT_EQ(options.wait_for_window_status, "ready");
}

TEST_F(ConfigTest, MissingKeysKeepTheirValues) {
  Config config;
  config.user_agent = "kept";
  config.LoadFile(WriteConfig(R"({"conversion": {"keep_temp_dir": true}})"));
  EXPECT_EQ(config.user_agent, "kept");
  EXPECT_TRUE(config.keep_temp_dir);
}

TEST_F(ConfigTest, BadFilesAreConfigurationErrors) {
  Config config;
  EXPECT_THROW(config.LoadFile(scratch_.path() + "/missing.json"), ConfigurationError);
  EXPECT_THROW(config.LoadFile(WriteConfig("{not json")), ConfigurationError);
  EXPECT_THROW(config.LoadFile(WriteConfig("[1, 2]")), ConfigurationError);
  EXPECT_THROW(config.LoadFile(WriteConfig(R"({"conversion": {"timeout_ms": "soon"}})")),
               ConfigurationError);
  EXPECT_THROW(config.LoadFile(WriteConfig(R"({"page": {"paper_format": "B5"}})")),
               ConfigurationError);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  Config config;
  config.LoadFile(WriteConfig(R"({"conversion": {"timeout_ms": 1000}, "logging": {"level": "warn"}})"));

  setenv("INK_CONVERSION_TIMEOUT_MS", "2500", 1);
  setenv("INK_LOG_LEVEL", "error", 1);
  config.LoadEnvironment();
  EXPECT_EQ(config.conversion_timeout_ms, 2500);
  EXPECT_EQ(config.log_level, "error");

  setenv("INK_CONVERSION_TIMEOUT_MS", "12s", 1);
  EXPECT_THROW(config.LoadEnvironment(), ConfigurationError);
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
  Config config;
  config.conversion_timeout_ms = -5;
  EXPECT_THROW(config.Validate(), ConfigurationError);

  config = Config();
  config.window_height = 0;
  EXPECT_THROW(config.Validate(), ConfigurationError);

  config = Config();
  config.temp_dir = scratch_.path() + "/missing";
  EXPECT_THROW(config.Validate(), ConfigurationError);

  config = Config();
  config.page_settings.scale = 3;
  EXPECT_THROW(config.Validate(), ConfigurationError);
}

TEST_F(ConfigTest, ParseHelpers) {
  EXPECT_EQ(ParseConfigInt("42", "x"), 42);
  EXPECT_EQ(ParseConfigInt("-7", "x"), -7);
  EXPECT_THROW(ParseConfigInt("", "x"), ConfigurationError);
  EXPECT_THROW(ParseConfigInt("-", "x"), ConfigurationError);
  EXPECT_THROW(ParseConfigInt("4 2", "x"), ConfigurationError);

  std::vector<std::string> items = SplitList(" *.png , ,*.gif,");
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0], "*.png");
  EXPECT_EQ(items[1], "*.gif");
}

TEST_F(ConfigTest, CreateConverterAppliesBrowserSettings) {
  Config config;
  config.chrome_path = test::WriteFakeChrome(scratch_.path());
  config.chrome_arguments = {"--lang=nl", "--disable-web-security"};
  config.user_agent = "Inkwell/1.0";
  config.window_width = 800;
  config.window_height = 600;
  config.pre_wrap_extensions = {"TXT"};

  std::unique_ptr<Converter> converter = config.CreateConverter();
  std::vector<std::string> arguments = converter->DefaultChromeArguments();
  auto has = [&](const std::string& entry) {
    return std::find(arguments.begin(), arguments.end(), entry) != arguments.end();
  };
  EXPECT_TRUE(has("--lang=\"nl\""));
  EXPECT_TRUE(has("--disable-web-security"));
  EXPECT_TRUE(has("--user-agent=\"Inkwell/1.0\""));
  EXPECT_TRUE(has("--window-size=\"800,600\""));
  EXPECT_EQ(converter->pre_wrap_extensions()[0], ".txt");
  EXPECT_TRUE(converter->disk_cache_disabled());
}

}  // namespace
}  // namespace ink
