#pragma once

#include <set>
#include <string>
#include <vector>

namespace ink {

// Anchored, case sensitive match of `text` against a pattern in which '*'
// matches any run of characters and everything else is literal.
bool WildcardMatch(const std::string& text, const std::string& pattern);

// Blocks requests whose full URL matches a wildcard pattern, unless the URL
// is on the allow-list (intermediate files generated for the conversion).
class UrlBlacklist {
 public:
  UrlBlacklist() = default;
  explicit UrlBlacklist(const std::vector<std::string>& patterns);

  void SetPatterns(const std::vector<std::string>& patterns);
  const std::vector<std::string>& patterns() const { return patterns_; }
  bool empty() const { return patterns_.empty(); }

  bool Matches(const std::string& url) const;

  // Matches() and not allowed.
  bool ShouldBlock(const std::string& url, const std::set<std::string>& allowed) const;

 private:
  std::vector<std::string> patterns_;
};

}  // namespace ink
