#include "SessionCache.hpp"

namespace rv {
shared_ptr<Session> SessionCache::getOrCreate(
    const string& hostname, const shared_ptr<Multiplexer>& multiplexer) {
  lock_guard<std::mutex> guard(cacheMutex);
  bool exists = multiplexer->hasSession(hostname);
  auto it = sessions.find(hostname);

  if (exists) {
    if (it != sessions.end()) {
      return it->second;
    }
    LOG(INFO) << "Adopting existing tmux session " << hostname;
    auto session = make_shared<Session>(hostname);
    sessions[hostname] = session;
    return session;
  }

  if (it != sessions.end()) {
    LOG(WARNING) << "tmux session " << hostname
                 << " disappeared, creating it again";
  } else {
    LOG(INFO) << "New host " << hostname << " connected, creating session";
  }
  try {
    multiplexer->newSession(hostname);
  } catch (const std::runtime_error& re) {
    // A concurrent tmux client may have won the race, the window step will
    // tell.
    LOG(WARNING) << "Creating session " << hostname << " failed: " << re.what();
  }
  if (it != sessions.end()) {
    // Keep the old handle so window numbers keep counting up
    return it->second;
  }
  auto session = make_shared<Session>(hostname);
  sessions[hostname] = session;
  return session;
}

shared_ptr<Session> SessionCache::find(const string& hostname) {
  lock_guard<std::mutex> guard(cacheMutex);
  auto it = sessions.find(hostname);
  if (it == sessions.end()) {
    return shared_ptr<Session>();
  }
  return it->second;
}

size_t SessionCache::size() {
  lock_guard<std::mutex> guard(cacheMutex);
  return sessions.size();
}
}  // namespace rv
