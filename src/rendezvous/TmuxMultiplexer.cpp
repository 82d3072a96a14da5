#include "TmuxMultiplexer.hpp"

namespace rv {
namespace {
string describe(const vector<string>& args) {
  string s;
  for (const auto& arg : args) {
    if (!s.empty()) {
      s += " ";
    }
    s += arg;
  }
  return s;
}

string trimTrailingWhitespace(string s) {
  while (!s.empty() && isspace((unsigned char)s.back())) {
    s.pop_back();
  }
  return s;
}
}  // namespace

TmuxMultiplexer::TmuxMultiplexer(shared_ptr<SubprocessUtils> _subprocessUtils,
                                 const string& _tmuxPath)
    : subprocessUtils(_subprocessUtils), tmuxPath(_tmuxPath) {}

SubprocessResult TmuxMultiplexer::runTmux(const vector<string>& args) {
  VLOG(1) << "Running " << tmuxPath << " " << describe(args);
  return subprocessUtils->run(tmuxPath, args);
}

void TmuxMultiplexer::runTmuxOrThrow(const vector<string>& args,
                                     SubprocessResult* result) {
  SubprocessResult r = runTmux(args);
  if (r.exitStatus != 0) {
    throw std::runtime_error("tmux " + describe(args) + " exited with " +
                             to_string(r.exitStatus));
  }
  if (result) {
    *result = r;
  }
}

bool TmuxMultiplexer::hasSession(const string& name) {
  SubprocessResult r;
  try {
    // '=' asks tmux for an exact match instead of a prefix match
    r = runTmux({"has-session", "-t", "=" + name});
  } catch (const std::runtime_error& re) {
    throw RoutingError(string("Could not query tmux: ") + re.what());
  }
  if (r.exitStatus == 0) {
    return true;
  }
  if (r.exitStatus == 1) {
    return false;
  }
  throw RoutingError("tmux has-session for " + name + " exited with " +
                     to_string(r.exitStatus));
}

void TmuxMultiplexer::newSession(const string& name) {
  runTmuxOrThrow({"new-session", "-d", "-s", name}, NULL);
}

string TmuxMultiplexer::newWindow(const string& session,
                                  const string& window) {
  SubprocessResult r;
  runTmuxOrThrow({"new-window", "-d", "-P", "-F", "#{pane_id}", "-t",
                  "=" + session + ":", "-n", window},
                 &r);
  string paneId = trimTrailingWhitespace(r.output);
  if (paneId.empty()) {
    throw std::runtime_error("tmux did not report a pane for window " +
                             window);
  }
  return paneId;
}

void TmuxMultiplexer::execInPane(const string& paneTarget,
                                 const string& command) {
  runTmuxOrThrow({"send-keys", "-t", paneTarget, command, "C-m"}, NULL);
}
}  // namespace rv
