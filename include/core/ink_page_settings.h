#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace ink {

enum class PaperFormat {
  LETTER,
  LEGAL,
  TABLOID,
  LEDGER,
  A0,
  A1,
  A2,
  A3,
  A4,
  A5,
  A6,
  // Page size follows the rendered content; requires a ContentFitTransformer
  FIT_PAGE_TO_CONTENT
};

enum class ColorMode {
  COLOR,
  GRAYSCALE
};

// Parses "A4", "letter", "FitPageToContent", ... (any case). Returns false
// for unknown names.
bool ParsePaperFormat(const std::string& name, PaperFormat* out);

// Print options for Page.printToPDF. Sizes are in inches.
struct PageSettings {
  bool landscape = false;
  bool display_header_footer = false;
  bool print_background = false;
  double scale = 1.0;

  PaperFormat paper_format = PaperFormat::LETTER;
  double paper_width = 8.5;
  double paper_height = 11.0;

  double margin_top = 0.4;
  double margin_bottom = 0.4;
  double margin_left = 0.4;
  double margin_right = 0.4;

  std::string page_ranges;  // e.g. "1-5, 8, 11-13"; empty = all pages
  std::string header_template;
  std::string footer_template;
  bool prefer_css_page_size = false;

  ColorMode color_mode = ColorMode::COLOR;

  // Sets paper_format and the matching width/height. FitPageToContent keeps
  // the current size.
  void SetPaperFormat(PaperFormat format);

  // Throws ConfigurationError for a scale outside 0.1..2, a non-positive
  // paper size or a negative margin.
  void Validate() const;

  nlohmann::json ToPrintParams() const;
};

}  // namespace ink
