#pragma once

#include <string>

namespace ink {

// Wraps plain text files in an HTML <pre> document so the browser renders
// them with a predictable font instead of as a download.
class PreWrapper {
 public:
  explicit PreWrapper(std::string output_dir);

  std::string font_family = "Courier New";
  std::string font_style = "normal";
  std::string font_size = "12px";
  bool word_wrap = true;

  // Writes <output_dir>/<input name>.html and returns its path. Throws
  // ConversionError when the input can not be read or the output written.
  std::string WrapFile(const std::string& input_file) const;

  // Complete HTML document for `text`
  std::string Wrap(const std::string& text, const std::string& title) const;

  static std::string EscapeHtml(const std::string& text);

 private:
  std::string output_dir_;
};

}  // namespace ink
