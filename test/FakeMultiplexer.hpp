#ifndef __RV_FAKE_MULTIPLEXER__
#define __RV_FAKE_MULTIPLEXER__

#include <functional>

#include "Multiplexer.hpp"

namespace rv {
/**
 * Multiplexer that keeps its sessions in memory and records every call.
 */
class FakeMultiplexer : public Multiplexer {
 public:
  FakeMultiplexer()
      : failHasSession(false),
        failNewSession(false),
        failNewWindow(false),
        failExec(false),
        callDelayMs(0),
        nextPaneId(0) {}

  virtual ~FakeMultiplexer() {}

  virtual bool hasSession(const string& name) {
    delay();
    lock_guard<std::mutex> guard(fakeMutex);
    hasSessionCalls.push_back(name);
    if (failHasSession) {
      throw RoutingError("fake tmux server is not running");
    }
    return sessions.count(name) > 0;
  }

  virtual void newSession(const string& name) {
    delay();
    lock_guard<std::mutex> guard(fakeMutex);
    newSessionCalls.push_back(name);
    if (failNewSession) {
      throw std::runtime_error("fake new-session failed");
    }
    if (sessions.count(name)) {
      throw std::runtime_error("duplicate session: " + name);
    }
    sessions.insert(name);
  }

  virtual string newWindow(const string& session, const string& window) {
    lock_guard<std::mutex> guard(fakeMutex);
    newWindowCalls.push_back(make_pair(session, window));
    if (failNewWindow) {
      throw std::runtime_error("fake new-window failed");
    }
    string paneId = "%" + to_string(nextPaneId++);
    windowsByPane[paneId] = session + ":" + window;
    return paneId;
  }

  virtual void execInPane(const string& paneTarget, const string& command) {
    std::function<void(const string&, const string&)> hook;
    {
      lock_guard<std::mutex> guard(fakeMutex);
      execCalls.push_back(make_pair(paneTarget, command));
      if (failExec) {
        throw std::runtime_error("fake send-keys failed");
      }
      hook = onExec;
    }
    if (hook) {
      hook(paneTarget, command);
    }
  }

  /** Drops a session as if somebody ran tmux kill-session. */
  void killSession(const string& name) {
    lock_guard<std::mutex> guard(fakeMutex);
    sessions.erase(name);
  }

  void addExistingSession(const string& name) {
    lock_guard<std::mutex> guard(fakeMutex);
    sessions.insert(name);
  }

  vector<string> getNewSessionCalls() {
    lock_guard<std::mutex> guard(fakeMutex);
    return newSessionCalls;
  }

  vector<pair<string, string>> getNewWindowCalls() {
    lock_guard<std::mutex> guard(fakeMutex);
    return newWindowCalls;
  }

  vector<pair<string, string>> getExecCalls() {
    lock_guard<std::mutex> guard(fakeMutex);
    return execCalls;
  }

  bool failHasSession;
  bool failNewSession;
  bool failNewWindow;
  bool failExec;
  /** Slows session queries down to widen race windows. */
  int callDelayMs;
  /** Called after every recorded execInPane, outside the lock. */
  std::function<void(const string&, const string&)> onExec;

 protected:
  void delay() {
    if (callDelayMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(callDelayMs));
    }
  }

  std::mutex fakeMutex;
  set<string> sessions;
  map<string, string> windowsByPane;
  vector<string> hasSessionCalls;
  vector<string> newSessionCalls;
  vector<pair<string, string>> newWindowCalls;
  vector<pair<string, string>> execCalls;
  int nextPaneId;
};
}  // namespace rv

#endif  // __RV_FAKE_MULTIPLEXER__
