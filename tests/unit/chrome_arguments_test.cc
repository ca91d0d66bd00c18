#include "core/ink_chrome_arguments.h"
#include "core/ink_errors.h"
#include <gtest/gtest.h>
#include <algorithm>

namespace ink {
namespace {

bool HasEntry(const std::vector<std::string>& list, const std::string& entry) {
  return std::find(list.begin(), list.end(), entry) != list.end();
}

TEST(ChromeArgumentsTest, DefaultsIncludeControlFlags) {
  ChromeArguments arguments;
  EXPECT_TRUE(arguments.Contains("--headless"));
  EXPECT_TRUE(arguments.Contains("--no-first-run"));
  EXPECT_EQ(arguments.ValueOf("--remote-debugging-port"), "0");
  EXPECT_EQ(arguments.ValueOf("--window-size"), "1366,768");
}

TEST(ChromeArgumentsTest, BareFlagsAreDeduplicatedIgnoringCase) {
  ChromeArguments arguments;
  size_t before = arguments.flags().size();
  arguments.Add("--HEADLESS");
  arguments.Add("--disable-web-security");
  arguments.Add("--Disable-Web-Security");
  EXPECT_EQ(arguments.flags().size(), before + 1);
}

TEST(ChromeArgumentsTest, ValuedFlagReplacesByName) {
  ChromeArguments arguments;
  arguments.Add("--proxy-server", "http://proxy:8080");
  arguments.Add("--proxy-server", "http://other:3128");
  EXPECT_EQ(arguments.ValueOf("--proxy-server"), "http://other:3128");
  EXPECT_EQ(std::count_if(arguments.flags().begin(), arguments.flags().end(),
                          [](const ChromeFlag& f) { return f.name == "--proxy-server"; }),
            1);
}

TEST(ChromeArgumentsTest, DisplayFormQuotesValuesArgvDoesNot) {
  ChromeArguments arguments;
  arguments.Add("--user-agent", "Test Agent");
  EXPECT_TRUE(HasEntry(arguments.ToDisplayList(), "--user-agent=\"Test Agent\""));
  EXPECT_TRUE(HasEntry(arguments.ToArgv(), "--user-agent=Test Agent"));
}

TEST(ChromeArgumentsTest, BlankFlagIsRejected) {
  ChromeArguments arguments;
  EXPECT_THROW(arguments.Add("   "), ConfigurationError);
  EXPECT_THROW(arguments.Add("", "value"), ConfigurationError);
}

TEST(ChromeArgumentsTest, MandatoryFlagsCannotBeRemoved) {
  ChromeArguments arguments;
  EXPECT_THROW(arguments.Remove("--headless"), ConfigurationError);
  EXPECT_THROW(arguments.Remove("--no-first-run"), ConfigurationError);
  EXPECT_THROW(arguments.Remove("--remote-debugging-port=0"), ConfigurationError);
}

TEST(ChromeArgumentsTest, RemoveAcceptsNameOrDisplayForm) {
  ChromeArguments arguments;
  EXPECT_TRUE(arguments.Remove("--disable-gpu"));
  EXPECT_FALSE(arguments.Contains("--disable-gpu"));
  EXPECT_FALSE(arguments.Remove("--disable-gpu"));

  EXPECT_TRUE(arguments.Remove("--window-size=\"1366,768\""));
  EXPECT_FALSE(arguments.Contains("--window-size"));
}

TEST(ChromeArgumentsTest, ResetRestoresDefaults) {
  ChromeArguments arguments;
  size_t defaults = arguments.flags().size();
  arguments.Add("--extra");
  arguments.Remove("--disable-gpu");
  arguments.Reset();
  EXPECT_EQ(arguments.flags().size(), defaults);
  EXPECT_TRUE(arguments.Contains("--disable-gpu"));
  EXPECT_FALSE(arguments.Contains("--extra"));
}

TEST(WindowSizeTest, ParsesPresetsAndDimensions) {
  int width = 0;
  int height = 0;
  ASSERT_TRUE(ParseWindowSize("fhd", &width, &height));
  EXPECT_EQ(width, 1920);
  EXPECT_EQ(height, 1080);
  ASSERT_TRUE(ParseWindowSize("800x600", &width, &height));
  EXPECT_EQ(width, 800);
  ASSERT_TRUE(ParseWindowSize("1024,768", &width, &height));
  EXPECT_EQ(height, 768);
  EXPECT_FALSE(ParseWindowSize("wide", &width, &height));
  EXPECT_FALSE(ParseWindowSize("0x600", &width, &height));

  WindowSizeToPixels(WindowSize::UHD_4K, &width, &height);
  EXPECT_EQ(width, 3840);
  EXPECT_EQ(height, 2160);
}

}  // namespace
}  // namespace ink
