#include "PipeSocketHandler.hpp"
#include "PipeTestUtils.hpp"
#include "RendezvousPath.hpp"
#include "TestHeaders.hpp"

using namespace rv;

TEST_CASE("Allocates distinct absolute paths that do not exist yet",
          "[RendezvousPath]") {
  string dir = createTempDirectory("rv_test_paths");
  set<string> paths;
  for (int i = 0; i < 200; i++) {
    string path = RendezvousPath::allocate(dir, "alice");
    REQUIRE(path[0] == '/');
    REQUIRE(fs::path(path).filename().string().rfind("alice.", 0) == 0);
    REQUIRE(path.length() <= PipeSocketHandler::maxPathLength());
    REQUIRE(!fs::exists(path));
    paths.insert(path);
  }
  REQUIRE(paths.size() == 200);
  REQUIRE(fs::is_empty(dir));
  fs::remove_all(dir);
}

TEST_CASE("Refuses paths that do not fit a socket address",
          "[RendezvousPath]") {
  string dir = createTempDirectory("rv_test_paths");
  string deepDir = dir + "/" + string(100, 'd');
  REQUIRE(::mkdir(deepDir.c_str(), 0700) == 0);

  REQUIRE_THROWS_AS(RendezvousPath::allocate(deepDir, "alice"), RoutingError);
  REQUIRE(fs::is_empty(deepDir));
  fs::remove_all(dir);
}

TEST_CASE("Fails in a directory that does not exist", "[RendezvousPath]") {
  REQUIRE_THROWS_AS(
      RendezvousPath::allocate("/nonexistent/rv_state_dir", "alice"),
      RoutingError);
}

TEST_CASE("Removing is idempotent", "[RendezvousPath]") {
  string dir = createTempDirectory("rv_test_paths");
  string path = dir + "/bob.sock";
  FILE* f = fopen(path.c_str(), "w");
  REQUIRE(f != NULL);
  fclose(f);

  RendezvousPath::remove(path);
  REQUIRE(!fs::exists(path));
  RendezvousPath::remove(path);
  REQUIRE(!fs::exists(path));
  fs::remove_all(dir);
}

TEST_CASE("Creates a private state directory", "[RendezvousPath]") {
  string dir = createTempDirectory("rv_test_state");
  string stateDir = dir + "/.state";

  StateDirectory stateDirectory(stateDir);
  stateDirectory.createIfRequired();
  struct stat stateStat;
  REQUIRE(::stat(stateDir.c_str(), &stateStat) == 0);
  REQUIRE(S_ISDIR(stateStat.st_mode));
  REQUIRE((stateStat.st_mode & 0777) == 0700);

  // A second run finds it in place
  stateDirectory.createIfRequired();
  REQUIRE(stateDirectory.getPath() == stateDir);
  fs::remove_all(dir);
}
