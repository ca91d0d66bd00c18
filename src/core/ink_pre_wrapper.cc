#include "core/ink_pre_wrapper.h"
#include "core/ink_errors.h"
#include "util/ink_file_util.h"
#include "util/logger.h"

namespace ink {

PreWrapper::PreWrapper(std::string output_dir)
    : output_dir_(std::move(output_dir)) {}

std::string PreWrapper::EscapeHtml(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size() + text.size() / 8);
  for (char c : text) {
    switch (c) {
      case '&': escaped += "&amp;"; break;
      case '<': escaped += "&lt;"; break;
      case '>': escaped += "&gt;"; break;
      case '"': escaped += "&quot;"; break;
      case '\'': escaped += "&#39;"; break;
      default: escaped += c; break;
    }
  }
  return escaped;
}

std::string PreWrapper::Wrap(const std::string& text, const std::string& title) const {
  std::string style = "font-family: " + font_family + "; font-style: " + font_style +
                      "; font-size: " + font_size + ";";
  if (word_wrap) {
    style += " white-space: pre-wrap; word-wrap: break-word;";
  }

  return "<!DOCTYPE html>\n"
         "<html>\n"
         "<head>\n"
         "<meta charset=\"utf-8\">\n"
         "<title>" + EscapeHtml(title) + "</title>\n"
         "</head>\n"
         "<body>\n"
         "<pre style=\"" + style + "\">" + EscapeHtml(text) + "</pre>\n"
         "</body>\n"
         "</html>\n";
}

std::string PreWrapper::WrapFile(const std::string& input_file) const {
  std::string text;
  if (!ReadFile(input_file, &text)) {
    throw ConversionError("Could not read the file '" + input_file + "'");
  }

  std::string output_file = output_dir_ + "/" + BaseName(input_file) + ".html";
  if (!WriteFile(output_file, Wrap(text, BaseName(input_file)))) {
    throw ConversionError("Could not write the file '" + output_file + "'");
  }

  LOG_INFO("PreWrapper", "File '" + input_file + "' wrapped into '" + output_file + "'");
  return output_file;
}

}  // namespace ink
