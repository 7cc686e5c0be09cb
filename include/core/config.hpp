#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "core/iso_date.hpp"
#include "core/title_filter.hpp"

namespace ytp {

// Feed XML and artwork live under this subdirectory of the data dir
inline constexpr const char* kMetadataSubdir = "meta";

struct WatchPolicy {
  int check_interval_minutes = 0;

  // Handed to the external downloader untouched
  std::string download_format_selector = "";
  std::string download_file_extension = "";   // normalized: no leading '.'

  std::string serve_host = "";
  int serve_port = 0;
  bool serve_directory_listings = false;

  // http://host[:port]/path, port left out when it is 80
  std::string UrlFor(const std::string& relative_path) const;
};

struct FeedDefinition {
  std::string channel_ref = "";

  // Filled in by the channel resolver after load, never by the loader
  std::string channel_id = "";
  std::string channel_readable_name = "";

  std::string name = "";
  std::string short_name = "";   // primary key
  std::string description = "";

  std::string title_filter_pattern = "";
  TitleFilter title_filter{};

  std::string epoch_str = "";
  std::optional<DateTP> epoch{};  // empty = no epoch constraint

  bool vidya = false;
  std::string custom_image_path = "";

  bool HasEpoch() const { return epoch.has_value(); }

  std::string FeedPath() const;
  std::string ArtPath() const;
};

std::ostream& operator<<(std::ostream& os, const FeedDefinition& feed);

struct AppConfig {
  std::string api_key = "";
  WatchPolicy watch{};
  std::vector<FeedDefinition> feeds{};
};

struct LoadOptions {
  std::size_t min_feeds = 3;
};

}
