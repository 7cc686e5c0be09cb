#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>

namespace ytp {

// Short names seen so far in one load pass. Lives only as long as that pass
class ShortNameSet {
public:
  // Throws DuplicateKeyError if short_name was already claimed
  void Claim(const std::string& short_name);

  bool Contains(const std::string& short_name) const { return seen_.count(short_name) != 0; }
  std::size_t size() const { return seen_.size(); }

private:
  std::unordered_set<std::string> seen_;
};

} // namespace ytp
