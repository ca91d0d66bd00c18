#pragma once

#include "core/ink_page_settings.h"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ink {

// Rewrites HTML documents before they reach the browser. Implementations
// live outside this library; the converter only calls them.
//
// Every method returns the URL of a rewritten document written into
// `temp_dir`, or nullopt when the input was left as is. URLs of generated
// intermediates the document refers to go into `safe_urls` so the blacklist
// does not block them.

class Sanitizer {
 public:
  virtual ~Sanitizer() = default;

  virtual std::optional<std::string> Sanitize(const std::string& url,
                                              const std::string& temp_dir,
                                              std::set<std::string>* safe_urls) = 0;
};

struct ImageTransformOptions {
  bool resize = false;  // Shrink images wider than the printable area
  bool rotate = false;  // Apply EXIF orientation
  PageSettings page_settings;
  int64_t image_load_timeout_ms = -1;
  std::vector<std::string> url_blacklist;
};

class ImageTransformer {
 public:
  virtual ~ImageTransformer() = default;

  virtual std::optional<std::string> Transform(const std::string& url,
                                               const ImageTransformOptions& options,
                                               const std::string& temp_dir,
                                               std::set<std::string>* safe_urls) = 0;
};

class ContentFitTransformer {
 public:
  virtual ~ContentFitTransformer() = default;

  virtual std::optional<std::string> FitPageToContent(const std::string& url,
                                                      const std::string& temp_dir) = 0;
};

}  // namespace ink
