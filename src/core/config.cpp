#include "core/config.hpp"

#include <filesystem>

namespace ytp {

std::string WatchPolicy::UrlFor(const std::string& relative_path) const {
  std::string url = "http://" + serve_host;
  if (serve_port != 80) url += ":" + std::to_string(serve_port);
  url += "/";
  url += relative_path;
  return url;
}

static std::string MetadataPath(const std::string& short_name, const char* ext) {
  return (std::filesystem::path(kMetadataSubdir) / (short_name + ext)).generic_string();
}

std::string FeedDefinition::FeedPath() const { return MetadataPath(short_name, ".xml"); }

std::string FeedDefinition::ArtPath() const { return MetadataPath(short_name, ".jpg"); }

std::ostream& operator<<(std::ostream& os, const FeedDefinition& feed) {
  return os << feed.short_name;
}

} // namespace ytp
