#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace re2 {
class RE2;
}

/*
    TitleFilter is the compiled, case-insensitive form of a feed's title_filter pattern.

    Patterns use RE2 syntax, the same dialect the config files have always been written in.
    Each FeedDefinition owns its own TitleFilter, rebuilt on every load; copying a filter
    compiles a fresh matcher rather than sharing one. Matching is a search (the pattern may
    hit anywhere in the title), and an empty pattern matches every title.
    Matches() is const, so any number of readers may share one loaded config.
*/

namespace ytp {

class TitleFilterError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class TitleFilter {
public:
  // Matches everything
  TitleFilter();
  ~TitleFilter();

  TitleFilter(const TitleFilter& other);
  TitleFilter& operator=(const TitleFilter& other);
  TitleFilter(TitleFilter&&) noexcept;
  TitleFilter& operator=(TitleFilter&&) noexcept;

  // Throws TitleFilterError if the pattern does not compile
  static TitleFilter Compile(const std::string& pattern);

  bool Matches(const std::string& title) const;

  const std::string& pattern() const { return pattern_; }

private:
  explicit TitleFilter(std::string pattern);

  std::string pattern_;
  std::unique_ptr<re2::RE2> re_;   // null when the pattern is empty
};

} // namespace ytp
