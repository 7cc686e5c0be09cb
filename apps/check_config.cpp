#include <iomanip>
#include <iostream>

#include "core/config_loader.hpp"
#include "core/iso_date.hpp"

// check_config.cpp loads a config file exactly the way startup does and prints what it resolved to.
// Exit code 0 means the file is usable, 1 means startup would abort.

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/example.yaml";

  try {
    const ytp::AppConfig cfg = ytp::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    const ytp::WatchPolicy& w = cfg.watch;
    std::cout << "check every " << w.check_interval_minutes << " min, "
              << "format '" << w.download_format_selector << "', "
              << "ext '" << w.download_file_extension << "'\n";
    std::cout << "serving on " << w.UrlFor("")
              << (w.serve_directory_listings ? " (directory listings on)" : "") << "\n\n";

    std::cout << std::left
              << std::setw(16) << "SHORT_NAME"
              << std::setw(12) << "EPOCH"
              << std::setw(8) << "VIDYA"
              << "FEED_URL"
              << "\n";
    std::cout << std::string(16 + 12 + 8 + 24, '-') << "\n";

    for (const auto& f : cfg.feeds) {
      std::cout << std::left
                << std::setw(16) << f
                << std::setw(12) << (f.HasEpoch() ? ytp::FormatIsoDate(*f.epoch) : "-")
                << std::setw(8) << (f.vidya ? "yes" : "no")
                << w.UrlFor(f.FeedPath())
                << "\n";
      if (!f.title_filter_pattern.empty()) std::cout << "    title filter: " << f.title_filter_pattern << "\n";
      if (!f.custom_image_path.empty()) std::cout << "    custom image: " << f.custom_image_path << "\n";
      else std::cout << "    art: " << w.UrlFor(f.ArtPath()) << "\n";
    }

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
