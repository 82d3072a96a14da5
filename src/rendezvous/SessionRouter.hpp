#ifndef __RV_SESSION_ROUTER__
#define __RV_SESSION_ROUTER__

#include "Headers.hpp"
#include "Multiplexer.hpp"
#include "RendezvousPath.hpp"
#include "SessionCache.hpp"

namespace rv {
/**
 * @brief Gives each agent callback a tmux window and a rendezvous path, and
 * starts a bridge in that window.
 */
class SessionRouter {
 public:
  /** @brief Rings the terminal bell so the operator notices the new window. */
  static const string BELL_COMMAND;

  SessionRouter(shared_ptr<Multiplexer> _multiplexer,
                shared_ptr<SessionCache> _sessionCache,
                const string& _stateDirectory, const string& _selfExecutable);

  /**
   * @brief Routes one callback.
   *
   * Gets or creates the host's session, opens window `<user>.<n>`, reserves a
   * rendezvous path and asks the window's pane to run
   * `<self> --socket <path>`.  Window and pane failures are logged and
   * tolerated.
   * @return The absolute rendezvous path the bridge will listen on.
   * @throws RoutingError when tmux cannot be queried or no path can be
   * reserved.
   */
  string route(const AgentIdentity& identity);

  /** @brief Shell command line that starts a bridge on `rendezvousPath`. */
  string getBridgeCommand(const string& rendezvousPath) const;

  /**
   * @brief Absolute path of the running binary, falling back to `argv0`.
   */
  static string getSelfExecutable(const char* argv0);

 protected:
  shared_ptr<Multiplexer> multiplexer;
  shared_ptr<SessionCache> sessionCache;
  string stateDirectory;
  string selfExecutable;
};
}  // namespace rv

#endif  // __RV_SESSION_ROUTER__
