#include "core/short_name_set.hpp"

#include "core/config_errors.hpp"

namespace ytp {

void ShortNameSet::Claim(const std::string& short_name) {
  if (!seen_.insert(short_name).second) throw DuplicateKeyError(short_name);
}

} // namespace ytp
