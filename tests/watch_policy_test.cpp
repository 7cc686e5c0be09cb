// watch_policy_test.cpp – URL building, derived feed paths and the short-name set.

#include "core/config.hpp"
#include "core/config_errors.hpp"
#include "core/short_name_set.hpp"

#include "test_support.hpp"

using namespace ytp;

static void testUrlFor() {
  std::cout << "\n=== Test: UrlFor ===\n";
  WatchPolicy w;
  w.serve_host = "host";
  w.serve_port = 80;
  CHECK(w.UrlFor("x.xml") == "http://host/x.xml", "port 80 omitted");

  w.serve_port = 8080;
  CHECK(w.UrlFor("x.xml") == "http://host:8080/x.xml", "port 8080 kept");
  CHECK(w.UrlFor("meta/a.jpg") == "http://host:8080/meta/a.jpg", "nested path kept as-is");
  CHECK(w.UrlFor("") == "http://host:8080/", "empty path gives the root");
}

static void testFeedPaths() {
  std::cout << "\n=== Test: feed paths ===\n";
  FeedDefinition f;
  f.short_name = "vsauce";
  CHECK(f.FeedPath() == std::string(kMetadataSubdir) + "/vsauce.xml", "feed xml under metadata dir");
  CHECK(f.ArtPath() == std::string(kMetadataSubdir) + "/vsauce.jpg", "art jpg under metadata dir");

  std::ostringstream oss;
  oss << f;
  CHECK(oss.str() == "vsauce", "feed prints as its short name");
  CHECK(!f.HasEpoch(), "default feed has no epoch");

  f.epoch = DateTP{};
  CHECK(f.HasEpoch(), "an epoch at time zero is still an epoch");
}

static void testShortNameSet() {
  std::cout << "\n=== Test: ShortNameSet ===\n";
  ShortNameSet set;
  set.Claim("a");
  set.Claim("b");
  CHECK(set.size() == 2, "two distinct names claimed");
  CHECK(set.Contains("a") && !set.Contains("c"), "Contains");

  auto err = CatchAs<DuplicateKeyError>([&] { set.Claim("a"); });
  CHECK(err && err->short_name() == "a", "second claim of 'a' throws DuplicateKeyError");
  CHECK(set.size() == 2, "failed claim leaves the set unchanged");

  set.Claim("A");
  CHECK(set.size() == 3, "short names are case sensitive");
}

int main() {
  testUrlFor();
  testFeedPaths();
  testShortNameSet();

  std::cout << "\n" << (failures == 0 ? "ALL PASSED" : "FAILURES: " + std::to_string(failures)) << '\n';
  return failures == 0 ? 0 : 1;
}
