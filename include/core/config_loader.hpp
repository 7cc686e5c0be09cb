#pragma once
#include <string>
#include "core/config.hpp"
#include "core/config_errors.hpp"

namespace ytp {

// Reads the file at 'path', decodes it, validates, sanity checks and normalizes it.
// Throws a ConfigError subclass on the first problem; nothing is returned on failure
AppConfig LoadConfigFromYamlFile(const std::string& path, const LoadOptions& opts = {});

// Same pipeline on an in-memory document (YAML or JSON text)
AppConfig LoadConfigFromYamlString(const std::string& text, const LoadOptions& opts = {});

// Declarative rules: api key present, enough podcasts, usable short names
void ValidateOrThrow(const AppConfig& cfg, const LoadOptions& opts = {});

// Business rules on the watch policy, checked in a fixed order. Throws SanityError
void SanityCheckOrThrow(const WatchPolicy& watch);

}
