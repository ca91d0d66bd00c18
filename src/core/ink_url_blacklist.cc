#include "core/ink_url_blacklist.h"

namespace ink {

bool WildcardMatch(const std::string& text, const std::string& pattern) {
  size_t ti = 0;
  size_t pi = 0;
  // Position of the last '*' seen and the text position it was tried at
  size_t star = std::string::npos;
  size_t star_ti = 0;

  while (ti < text.length()) {
    if (pi < pattern.length() && pattern[pi] == '*') {
      star = pi++;
      star_ti = ti;
    } else if (pi < pattern.length() && pattern[pi] == text[ti]) {
      ti++;
      pi++;
    } else if (star != std::string::npos) {
      // Let the last '*' swallow one more character and retry
      pi = star + 1;
      ti = ++star_ti;
    } else {
      return false;
    }
  }

  while (pi < pattern.length() && pattern[pi] == '*') pi++;
  return pi == pattern.length();
}

UrlBlacklist::UrlBlacklist(const std::vector<std::string>& patterns) {
  SetPatterns(patterns);
}

void UrlBlacklist::SetPatterns(const std::vector<std::string>& patterns) {
  patterns_ = patterns;
}

bool UrlBlacklist::Matches(const std::string& url) const {
  for (const auto& pattern : patterns_) {
    if (WildcardMatch(url, pattern)) {
      return true;
    }
  }
  return false;
}

bool UrlBlacklist::ShouldBlock(const std::string& url, const std::set<std::string>& allowed) const {
  return Matches(url) && allowed.find(url) == allowed.end();
}

}  // namespace ink
