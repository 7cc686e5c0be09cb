#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

/*
    Every way a config load can fail. All derive from ConfigError so a caller that only
    wants to report and exit can catch one type; tests and tools can catch the exact one.
    what() always reads "Config error at '<key_path>': <message>".
*/

namespace ytp {

class ConfigError : public std::runtime_error {
public:
  ConfigError(std::string key_path, const std::string& msg);

  const std::string& key_path() const { return key_path_; }

private:
  std::string key_path_;
};

// Config file could not be read at all
class StorageError : public ConfigError {
public:
  StorageError(std::string path, std::string cause);

  const std::string& path() const { return path_; }
  const std::string& cause() const { return cause_; }

private:
  std::string path_;
  std::string cause_;
};

// Bytes are not a well-formed document of the expected shape
class DecodeError : public ConfigError {
public:
  using ConfigError::ConfigError;
};

enum class ValidationRule {
  Required,
  MinLength,
  PathSafe
};

const char* ToString(ValidationRule rule);

class ValidationError : public ConfigError {
public:
  ValidationError(std::string field, ValidationRule rule, const std::string& msg);

  const std::string& field() const { return key_path(); }
  ValidationRule rule() const { return rule_; }

private:
  ValidationRule rule_;
};

class SanityError : public ConfigError {
public:
  SanityError(std::string key_path, std::string cause);

  const std::string& cause() const { return cause_; }

private:
  std::string cause_;
};

// A single feed's epoch or title_filter could not be turned into a runtime value
class NormalizationError : public ConfigError {
public:
  NormalizationError(std::size_t entry, std::string short_name, std::string field, const std::string& msg);

  std::size_t entry() const { return entry_; }
  const std::string& short_name() const { return short_name_; }
  const std::string& field() const { return field_; }

private:
  std::size_t entry_;
  std::string short_name_;
  std::string field_;
};

class DuplicateKeyError : public ConfigError {
public:
  explicit DuplicateKeyError(std::string short_name);

  const std::string& short_name() const { return short_name_; }

private:
  std::string short_name_;
};

} // namespace ytp
