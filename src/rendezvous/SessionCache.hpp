#ifndef __RV_SESSION_CACHE__
#define __RV_SESSION_CACHE__

#include "Headers.hpp"
#include "Multiplexer.hpp"

namespace rv {
/**
 * @brief Handle on one multiplexer session, named after an agent host.
 */
class Session {
 public:
  explicit Session(const string& _name) : name(_name), windowCount(0) {}

  const string& getName() const { return name; }

  /**
   * @brief Claims the next window number.  Numbers start at 1 and are never
   * handed out twice by the same Session.
   */
  int reserveWindowNumber() {
    lock_guard<std::mutex> guard(windowMutex);
    return ++windowCount;
  }

  int getWindowCount() {
    lock_guard<std::mutex> guard(windowMutex);
    return windowCount;
  }

 protected:
  string name;
  int windowCount;
  std::mutex windowMutex;
};

/**
 * @brief Process-wide map from sanitized hostname to Session, shared by every
 * connection thread of the listener.
 */
class SessionCache {
 public:
  SessionCache() {}

  /**
   * @brief Returns the Session for `hostname`, creating the tmux session when
   * it does not exist yet.
   *
   * The existence check, the creation and the insert happen under one lock,
   * so concurrent callers for the same host trigger at most one newSession().
   * A session that exists in tmux but is unknown to this process is adopted
   * without being recreated.  A cached session that tmux no longer knows is
   * created again under the same handle.
   * @throws RoutingError when tmux cannot be queried.
   */
  shared_ptr<Session> getOrCreate(const string& hostname,
                                  const shared_ptr<Multiplexer>& multiplexer);

  /** @brief The cached Session, or nullptr. */
  shared_ptr<Session> find(const string& hostname);

  size_t size();

 protected:
  std::mutex cacheMutex;
  unordered_map<string, shared_ptr<Session>> sessions;
};
}  // namespace rv

#endif  // __RV_SESSION_CACHE__
