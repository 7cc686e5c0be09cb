#include "core/title_filter.hpp"

#include <re2/re2.h>

#include <utility>

namespace ytp {

TitleFilter::TitleFilter() = default;
TitleFilter::~TitleFilter() = default;

TitleFilter::TitleFilter(std::string pattern) : pattern_(std::move(pattern)) {
  if (pattern_.empty()) return;

  RE2::Options opts;
  opts.set_log_errors(false);

  // The (?i:...) wrapper makes the whole pattern case-insensitive
  auto re = std::make_unique<RE2>("(?i:" + pattern_ + ")", opts);
  if (!re->ok()) throw TitleFilterError(re->error());
  re_ = std::move(re);
}

TitleFilter::TitleFilter(const TitleFilter& other) : TitleFilter(other.pattern_) {}

TitleFilter& TitleFilter::operator=(const TitleFilter& other) {
  if (this != &other) *this = TitleFilter(other.pattern_);
  return *this;
}

TitleFilter::TitleFilter(TitleFilter&&) noexcept = default;
TitleFilter& TitleFilter::operator=(TitleFilter&&) noexcept = default;

TitleFilter TitleFilter::Compile(const std::string& pattern) {
  return TitleFilter(pattern);
}

bool TitleFilter::Matches(const std::string& title) const {
  if (!re_) return true;
  return RE2::PartialMatch(title, *re_);
}

} // namespace ytp
