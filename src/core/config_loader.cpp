#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "core/iso_date.hpp"
#include "core/short_name_set.hpp"
#include "core/title_filter.hpp"

namespace ytp {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::string IndexPath(const std::string& a, std::size_t i) {
  return a + "[" + std::to_string(i) + "]";
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

// An unquoted scalar the YAML 1.2 core schema resolves to a number or boolean
static bool IsPlainNumberOrBool(const YAML::Node& n) {
  if (n.Tag() != "?") return false;
  const std::string& s = n.Scalar();
  if (s == "true" || s == "True" || s == "TRUE" || s == "false" || s == "False" || s == "FALSE") return true;
  double d = 0.0;
  return YAML::convert<double>::decode(n, d);
}

// Missing or null keys keep their zero value so the later stages can name them
template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n || n.IsNull()) return fallback;
  if (!n.IsScalar()) throw DecodeError(key_path, "expected a scalar value");
  if constexpr (std::is_same_v<T, std::string>) {
    if (IsPlainNumberOrBool(n)) throw DecodeError(key_path, "expected a string, got '" + n.Scalar() + "'");
  }
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw DecodeError(key_path, "cannot convert '" + n.Scalar() + "': " + e.what());
  }
}

static std::string ReadFileOrThrow(const std::string& path) {
  namespace fs = std::filesystem;

  std::error_code ec;
  const fs::file_status st = fs::status(path, ec);
  if (st.type() == fs::file_type::not_found) throw StorageError(path, "no such file or directory");
  if (ec) throw StorageError(path, ec.message());
  if (fs::is_directory(st)) throw StorageError(path, "is a directory");

  std::ifstream in(path, std::ios::binary);
  if (!in) throw StorageError(path, std::strerror(errno));

  std::ostringstream oss;
  oss << in.rdbuf();
  if (in.bad()) throw StorageError(path, "read failed");
  return oss.str();
}

// The watch policy keys sit at the top level of the document
static void LoadWatchPolicy(const YAML::Node& root, WatchPolicy& w) {
  w.check_interval_minutes = GetOrKey<int>(root, "check_interval_minutes", "check_interval_minutes", w.check_interval_minutes);
  w.download_format_selector = GetOrKey<std::string>(root, "ytdl_fmt_selector", "ytdl_fmt_selector", w.download_format_selector);
  w.download_file_extension = GetOrKey<std::string>(root, "ytdl_write_ext", "ytdl_write_ext", w.download_file_extension);
  w.serve_host = GetOrKey<std::string>(root, "serve_host", "serve_host", w.serve_host);
  w.serve_port = GetOrKey<int>(root, "serve_port", "serve_port", w.serve_port);
  w.serve_directory_listings = GetOrKey<bool>(root, "serve_directory_listings", "serve_directory_listings", w.serve_directory_listings);
}

static FeedDefinition LoadFeed(const YAML::Node& node, const std::string& p) {
  if (!node.IsMap()) throw DecodeError(p, "expected a mapping");

  FeedDefinition f;
  f.channel_ref = GetOrKey<std::string>(node, "yt_channel", PathJoin(p, "yt_channel"), f.channel_ref);
  f.name = GetOrKey<std::string>(node, "name", PathJoin(p, "name"), f.name);
  f.short_name = GetOrKey<std::string>(node, "short_name", PathJoin(p, "short_name"), f.short_name);
  f.description = GetOrKey<std::string>(node, "description", PathJoin(p, "description"), f.description);
  f.title_filter_pattern = GetOrKey<std::string>(node, "title_filter", PathJoin(p, "title_filter"), f.title_filter_pattern);
  f.epoch_str = GetOrKey<std::string>(node, "epoch", PathJoin(p, "epoch"), f.epoch_str);
  f.vidya = GetOrKey<bool>(node, "vidya", PathJoin(p, "vidya"), f.vidya);
  f.custom_image_path = GetOrKey<std::string>(node, "custom_image", PathJoin(p, "custom_image"), f.custom_image_path);
  return f;
}

static void LoadFeeds(const YAML::Node& root, std::vector<FeedDefinition>& feeds) {
  const YAML::Node pods = Child(root, "podcasts");
  if (!pods || pods.IsNull()) return;
  const std::string p = "podcasts";
  if (!pods.IsSequence()) throw DecodeError(p, "expected a list of podcasts");

  feeds.reserve(pods.size());
  for (std::size_t i = 0; i < pods.size(); ++i) {
    feeds.push_back(LoadFeed(pods[i], IndexPath(p, i)));
  }
}

static AppConfig DecodeOrThrow(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw DecodeError("<document>", std::string("malformed document: ") + e.what());
  }

  if (!root || root.IsNull()) throw DecodeError("<document>", "empty document");
  if (!root.IsMap()) throw DecodeError("<document>", "top level must be a mapping");

  AppConfig cfg;
  cfg.api_key = GetOrKey<std::string>(root, "yt_data_api_key", "yt_data_api_key", cfg.api_key);
  LoadWatchPolicy(root, cfg.watch);
  LoadFeeds(root, cfg.feeds);
  return cfg;
}

static bool IsPathSafe(const std::string& s) {
  if (s == "." || s == "..") return false;
  return s.find_first_of("/\\") == std::string::npos;
}

void ValidateOrThrow(const AppConfig& cfg, const LoadOptions& opts) {
  if (cfg.api_key.empty())
    throw ValidationError("yt_data_api_key", ValidationRule::Required, "cannot be blank");

  if (cfg.feeds.size() < opts.min_feeds)
    throw ValidationError("podcasts", ValidationRule::MinLength,
                          "must have at least " + std::to_string(opts.min_feeds) + " entries, got " + std::to_string(cfg.feeds.size()));

  for (std::size_t i = 0; i < cfg.feeds.size(); ++i) {
    const std::string& sn = cfg.feeds[i].short_name;
    const std::string field = PathJoin(IndexPath("podcasts", i), "short_name");
    if (sn.empty()) throw ValidationError(field, ValidationRule::Required, "cannot be blank");
    if (!IsPathSafe(sn)) throw ValidationError(field, ValidationRule::PathSafe, "'" + sn + "' cannot be used as a file name");
  }
}

void SanityCheckOrThrow(const WatchPolicy& w) {
  if (const int min = 1; w.check_interval_minutes < min)
    throw SanityError("check_interval_minutes", "check interval must be >= " + std::to_string(min) + " minute");
  if (w.download_format_selector.empty()) throw SanityError("ytdl_fmt_selector", "missing format selector");
  if (w.download_file_extension.empty()) throw SanityError("ytdl_write_ext", "missing file extension");
  if (w.serve_host.empty()) throw SanityError("serve_host", "missing host");
  if (w.serve_port == 0) throw SanityError("serve_port", "missing port");
}

// ".m4a" and "m4a" mean the same thing
static void NormalizeWatchPolicy(WatchPolicy& w) {
  const auto first = w.download_file_extension.find_first_not_of('.');
  if (first == std::string::npos) throw SanityError("ytdl_write_ext", "missing file extension");
  w.download_file_extension.erase(0, first);
}

static void NormalizeFeed(FeedDefinition& f, std::size_t i) {
  if (!f.epoch_str.empty()) {
    const auto t = ParseIsoDate(f.epoch_str);
    if (!t) throw NormalizationError(i, f.short_name, "epoch", "'" + f.epoch_str + "' is not a YYYY-MM-DD date");
    f.epoch = *t;
  } else {
    f.epoch.reset();
  }

  try {
    f.title_filter = TitleFilter::Compile(f.title_filter_pattern);
  } catch (const TitleFilterError& e) {
    throw NormalizationError(i, f.short_name, "title_filter", "invalid pattern '" + f.title_filter_pattern + "': " + e.what());
  }
}

static AppConfig FinishOrThrow(AppConfig cfg, const LoadOptions& opts) {
  ValidateOrThrow(cfg, opts);

  SanityCheckOrThrow(cfg.watch);
  NormalizeWatchPolicy(cfg.watch);

  // One pass: a bad entry or a repeated short name stops before later entries are touched
  ShortNameSet short_names;
  for (std::size_t i = 0; i < cfg.feeds.size(); ++i) {
    NormalizeFeed(cfg.feeds[i], i);
    short_names.Claim(cfg.feeds[i].short_name);
  }

  return cfg;
}

AppConfig LoadConfigFromYamlString(const std::string& text, const LoadOptions& opts) {
  return FinishOrThrow(DecodeOrThrow(text), opts);
}

AppConfig LoadConfigFromYamlFile(const std::string& path, const LoadOptions& opts) {
  return LoadConfigFromYamlString(ReadFileOrThrow(path), opts);
}

} // namespace ytp
