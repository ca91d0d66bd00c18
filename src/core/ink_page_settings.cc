#include "core/ink_page_settings.h"
#include "core/ink_errors.h"
#include <algorithm>
#include <cctype>

namespace ink {

namespace {

struct PaperEntry {
  PaperFormat format;
  const char* name;
  double width;
  double height;
};

const PaperEntry kPapers[] = {
  {PaperFormat::LETTER, "letter", 8.5, 11},
  {PaperFormat::LEGAL, "legal", 8.5, 14},
  {PaperFormat::TABLOID, "tabloid", 11, 17},
  {PaperFormat::LEDGER, "ledger", 17, 11},
  {PaperFormat::A0, "a0", 33.1, 46.8},
  {PaperFormat::A1, "a1", 23.4, 33.1},
  {PaperFormat::A2, "a2", 16.54, 23.4},
  {PaperFormat::A3, "a3", 11.7, 16.54},
  {PaperFormat::A4, "a4", 8.27, 11.7},
  {PaperFormat::A5, "a5", 5.83, 8.27},
  {PaperFormat::A6, "a6", 4.13, 5.83},
};

}  // namespace

bool ParsePaperFormat(const std::string& name, PaperFormat* out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "fitpagetocontent" || lower == "fit") {
    *out = PaperFormat::FIT_PAGE_TO_CONTENT;
    return true;
  }
  for (const auto& paper : kPapers) {
    if (lower == paper.name) {
      *out = paper.format;
      return true;
    }
  }
  return false;
}

void PageSettings::SetPaperFormat(PaperFormat format) {
  paper_format = format;
  for (const auto& paper : kPapers) {
    if (paper.format == format) {
      paper_width = paper.width;
      paper_height = paper.height;
      return;
    }
  }
}

void PageSettings::Validate() const {
  if (scale < 0.1 || scale > 2.0) {
    throw ConfigurationError("Scale must be between 0.1 and 2, got " + std::to_string(scale));
  }
  if (paper_width <= 0 || paper_height <= 0) {
    throw ConfigurationError("Paper width and height must be greater than zero");
  }
  if (margin_top < 0 || margin_bottom < 0 || margin_left < 0 || margin_right < 0) {
    throw ConfigurationError("Margins can not be negative");
  }
}

nlohmann::json PageSettings::ToPrintParams() const {
  nlohmann::json params = {
    {"landscape", landscape},
    {"displayHeaderFooter", display_header_footer},
    {"printBackground", print_background},
    {"scale", scale},
    {"paperWidth", paper_width},
    {"paperHeight", paper_height},
    {"marginTop", margin_top},
    {"marginBottom", margin_bottom},
    {"marginLeft", margin_left},
    {"marginRight", margin_right},
    {"preferCSSPageSize", prefer_css_page_size}
  };

  if (!page_ranges.empty()) {
    params["pageRanges"] = page_ranges;
  }
  if (!header_template.empty()) {
    params["headerTemplate"] = header_template;
  }
  if (!footer_template.empty()) {
    params["footerTemplate"] = footer_template;
  }
  return params;
}

}  // namespace ink
