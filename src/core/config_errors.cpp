#include "core/config_errors.hpp"

#include <sstream>
#include <utility>

namespace ytp {

static std::string FormatConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return oss.str();
}

static std::string EntryPath(std::size_t entry, const std::string& field) {
  return "podcasts[" + std::to_string(entry) + "]." + field;
}

ConfigError::ConfigError(std::string key_path, const std::string& msg)
    : std::runtime_error(FormatConfigError(key_path, msg)), key_path_(std::move(key_path)) {}

StorageError::StorageError(std::string path, std::string cause)
    : ConfigError(path, "cannot read config file: " + cause), path_(std::move(path)), cause_(std::move(cause)) {}

const char* ToString(ValidationRule rule) {
  switch (rule) {
    case ValidationRule::Required: return "required";
    case ValidationRule::MinLength: return "min_length";
    case ValidationRule::PathSafe: return "path_safe";
  }
  return "unknown";
}

ValidationError::ValidationError(std::string field, ValidationRule rule, const std::string& msg)
    : ConfigError(std::move(field), msg + " [" + ToString(rule) + "]"), rule_(rule) {}

SanityError::SanityError(std::string key_path, std::string cause)
    : ConfigError(std::move(key_path), cause), cause_(std::move(cause)) {}

NormalizationError::NormalizationError(std::size_t entry, std::string short_name, std::string field, const std::string& msg)
    : ConfigError(EntryPath(entry, field), "podcast '" + short_name + "': " + msg),
      entry_(entry), short_name_(std::move(short_name)), field_(std::move(field)) {}

DuplicateKeyError::DuplicateKeyError(std::string short_name)
    : ConfigError("podcasts", "multiple podcasts using short_name \"" + short_name + "\""),
      short_name_(std::move(short_name)) {}

} // namespace ytp
