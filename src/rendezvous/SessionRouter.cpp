#include "SessionRouter.hpp"

namespace rv {
const string SessionRouter::BELL_COMMAND = "echo -e '\\a'";

SessionRouter::SessionRouter(shared_ptr<Multiplexer> _multiplexer,
                             shared_ptr<SessionCache> _sessionCache,
                             const string& _stateDirectory,
                             const string& _selfExecutable)
    : multiplexer(_multiplexer),
      sessionCache(_sessionCache),
      stateDirectory(_stateDirectory),
      selfExecutable(_selfExecutable) {}

string SessionRouter::route(const AgentIdentity& identity) {
  const string& hostname = identity.hostname();
  const string& username = identity.username();

  shared_ptr<Session> session =
      sessionCache->getOrCreate(hostname, multiplexer);

  string windowName =
      username + "." + to_string(session->reserveWindowNumber());
  string paneTarget;
  try {
    paneTarget = multiplexer->newWindow(session->getName(), windowName);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Creating window " << windowName << " in session "
                 << session->getName() << " failed: " << re.what();
    paneTarget = session->getName() + ":" + windowName;
  }

  string rendezvousPath = RendezvousPath::allocate(stateDirectory, username);

  try {
    multiplexer->execInPane(paneTarget, BELL_COMMAND);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Ringing the bell in " << paneTarget
                 << " failed: " << re.what();
  }

  string command = getBridgeCommand(rendezvousPath);
  try {
    multiplexer->execInPane(paneTarget, command);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Starting the bridge in " << paneTarget << " failed ("
                 << command << "): " << re.what();
  }

  LOG(INFO) << "New shell from " << identity << " in " << session->getName()
            << ":" << windowName << " via " << rendezvousPath;
  return rendezvousPath;
}

string SessionRouter::getBridgeCommand(const string& rendezvousPath) const {
  return shellQuote(selfExecutable) + " --socket " + shellQuote(rendezvousPath);
}

string SessionRouter::getSelfExecutable(const char* argv0) {
  std::error_code ec;
  fs::path self = fs::read_symlink("/proc/self/exe", ec);
  if (!ec && !self.empty()) {
    return self.string();
  }
  string fallback(argv0);
  if (fallback.find('/') != string::npos) {
    // Relative paths stop working once tmux starts the pane elsewhere
    fs::path absolute = fs::absolute(fallback, ec);
    if (!ec) {
      return absolute.string();
    }
  }
  return fallback;
}
}  // namespace rv
