#include "TestHeaders.hpp"
#include "TmuxMultiplexer.hpp"

using namespace rv;

namespace {
class ScriptedSubprocessUtils : public SubprocessUtils {
 public:
  virtual SubprocessResult run(const string& command,
                               const vector<string>& args) {
    commands.push_back(command);
    calls.push_back(args);
    if (throwOnRun) {
      throw std::runtime_error("Failed to fork: out of memory");
    }
    return nextResult;
  }

  SubprocessResult nextResult = {0, ""};
  bool throwOnRun = false;
  vector<string> commands;
  vector<vector<string>> calls;
};
}  // namespace

TEST_CASE("has-session maps exit codes", "[TmuxMultiplexer]") {
  shared_ptr<ScriptedSubprocessUtils> subprocess(new ScriptedSubprocessUtils());
  TmuxMultiplexer tmux(subprocess);

  subprocess->nextResult = {0, ""};
  REQUIRE(tmux.hasSession("web01"));
  REQUIRE(subprocess->commands[0] == "tmux");
  REQUIRE(subprocess->calls[0] ==
          vector<string>({"has-session", "-t", "=web01"}));

  subprocess->nextResult = {1, ""};
  REQUIRE_FALSE(tmux.hasSession("web01"));

  subprocess->nextResult = {127, ""};
  REQUIRE_THROWS_AS(tmux.hasSession("web01"), RoutingError);

  subprocess->throwOnRun = true;
  REQUIRE_THROWS_AS(tmux.hasSession("web01"), RoutingError);
}

TEST_CASE("Creates detached sessions", "[TmuxMultiplexer]") {
  shared_ptr<ScriptedSubprocessUtils> subprocess(new ScriptedSubprocessUtils());
  TmuxMultiplexer tmux(subprocess, "/usr/local/bin/tmux");

  tmux.newSession("web01");
  REQUIRE(subprocess->commands[0] == "/usr/local/bin/tmux");
  REQUIRE(subprocess->calls[0] ==
          vector<string>({"new-session", "-d", "-s", "web01"}));

  subprocess->nextResult = {1, ""};
  REQUIRE_THROWS_WITH(tmux.newSession("web01"),
                      ContainsSubstring("new-session"));
}

TEST_CASE("new-window reports the pane to type into", "[TmuxMultiplexer]") {
  shared_ptr<ScriptedSubprocessUtils> subprocess(new ScriptedSubprocessUtils());
  TmuxMultiplexer tmux(subprocess);

  subprocess->nextResult = {0, "%12\n"};
  REQUIRE(tmux.newWindow("web01", "alice.1") == "%12");
  REQUIRE(subprocess->calls[0] ==
          vector<string>({"new-window", "-d", "-P", "-F", "#{pane_id}", "-t",
                          "=web01:", "-n", "alice.1"}));

  SECTION("tmux fails") {
    subprocess->nextResult = {1, ""};
    REQUIRE_THROWS(tmux.newWindow("web01", "alice.2"));
  }
  SECTION("tmux prints nothing") {
    subprocess->nextResult = {0, "\n"};
    REQUIRE_THROWS(tmux.newWindow("web01", "alice.2"));
  }
}

TEST_CASE("Types commands followed by Enter", "[TmuxMultiplexer]") {
  shared_ptr<ScriptedSubprocessUtils> subprocess(new ScriptedSubprocessUtils());
  TmuxMultiplexer tmux(subprocess);

  tmux.execInPane("%12", "echo -e '\\a'");
  REQUIRE(subprocess->calls[0] ==
          vector<string>({"send-keys", "-t", "%12", "echo -e '\\a'", "C-m"}));

  subprocess->nextResult = {1, ""};
  REQUIRE_THROWS(tmux.execInPane("%12", "ls"));
}
