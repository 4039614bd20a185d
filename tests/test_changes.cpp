#include "test_framework.hpp"
#include "tests/helpers/local_runtime.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "runbox/sandbox/changes.hpp"

#include <fstream>

namespace {

// A running container with volume "data" mounted at /data.
std::string start_scanned_container(runbox::testing::LocalRuntimeClient &client) {
  if (!client.create_volume("data").ok()) {
    throw std::runtime_error("create_volume failed");
  }
  auto id = client.create_container(runbox::runtime::ContainerSpec{
      .name = "scanned",
      .image = "alpine:3.20",
      .mounts = {runbox::runtime::VolumeMount{.volume = "data", .target = "/data"}}});
  if (!id.ok() || !client.start_container(id.value()).ok()) {
    throw std::runtime_error("container setup failed");
  }
  return id.value();
}

void write_host_file(const std::filesystem::path &path, const std::string &content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << content;
}

} // namespace

void register_changes_tests(std::vector<runbox::tests::TestCase> &tests) {
  using runbox::tests::require;
  namespace sandbox = runbox::sandbox;

  tests.push_back({"changes_hidden_paths", [] {
                     require(sandbox::is_hidden_path(".env"), "dotfile");
                     require(sandbox::is_hidden_path("src/.git/config"), "hidden directory");
                     require(!sandbox::is_hidden_path("src/main.py"), "visible file");
                     require(!sandbox::is_hidden_path("./a.txt"), "leading ./ is not hidden");
                   }});

  tests.push_back({"changes_parse_listing", [] {
                     const auto listing = sandbox::parse_listing(
                         "1700000000 ./a.txt\n1700000001 ./dir/with space.txt\r\ngarbage\n"
                         "notanumber ./b\n");
                     require(listing.size() == 2, "two valid lines");
                     require(listing.at("a.txt") == 1700000000, "mtime parsed");
                     require(listing.contains("dir/with space.txt"), "spaces kept in names");
                   }});

  tests.push_back({"changes_detect_new_modified_removed", [] {
                     sandbox::FileSnapshot snapshot{
                         .taken_at = 1000,
                         .files = {{"same.txt", 900}, {"edited.txt", 900}, {"gone.txt", 900},
                                   {".hidden", 900}}};
                     const sandbox::FileListing current = {{"same.txt", 900},
                                                           {"edited.txt", 1001},
                                                           {"fresh.txt", 1000},
                                                           {".cache/x", 1005}};
                     const auto changes = sandbox::detect_changes(snapshot, current);
                     require(changes.changed.size() == 2, "edited and fresh");
                     require(changes.changed[0] == "edited.txt" && changes.changed[1] == "fresh.txt",
                             "sorted changed paths");
                     require(changes.removed.size() == 1 && changes.removed[0] == "gone.txt",
                             "removed path, hidden ignored");
                     require(changes.all_paths().size() == 3, "all_paths joins both");
                   }});

  tests.push_back({"changes_detect_mtime_moved_backwards", [] {
                     sandbox::FileSnapshot snapshot{.taken_at = 1000, .files = {{"a", 900}}};
                     const auto changes = sandbox::detect_changes(snapshot, {{"a", 800}});
                     require(changes.changed.size() == 1, "any mtime move counts");
                     require(sandbox::detect_changes(snapshot, {{"a", 900}}).empty(),
                             "unchanged listing");
                   }});

  tests.push_back({"changes_scanner_captures_and_collects", [] {
                     runbox::testing::LocalRuntimeClient client;
                     const auto container = start_scanned_container(client);
                     const auto root = client.host_path(container, "/data");
                     write_host_file(root / "src/app.py", "print('hi')\n");
                     write_host_file(root / ".git/HEAD", "ref\n");

                     sandbox::ContainerScanner scanner(client, container, "/data");
                     auto captured = scanner.capture();
                     require(captured.ok(), "capture should succeed: " + captured.error());
                     const auto &capture = captured.value();
                     require(capture.snapshot.taken_at > 0, "container clock read");
                     require(capture.snapshot.files.contains("src/app.py"), "file listed");
                     const auto *app = capture.pre_image.find("src/app.py");
                     require(app != nullptr && app->content == "print('hi')\n", "pre-image content");

                     write_host_file(root / "out.txt", "result\n");
                     auto listing = scanner.scan();
                     require(listing.ok() && listing.value().contains("out.txt"), "rescan sees new file");

                     auto collected = scanner.collect({"out.txt"});
                     require(collected.ok(), "collect should succeed: " + collected.error());
                     require(collected.value().find("out.txt")->content == "result\n",
                             "collected content");
                     require(collected.value().find("src/app.py") == nullptr,
                             "only requested paths collected");
                     auto nothing = scanner.collect({});
                     require(nothing.ok() && nothing.value().empty(), "empty request");
                   }});
}
