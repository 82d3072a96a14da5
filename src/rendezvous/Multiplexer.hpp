#ifndef __RV_MULTIPLEXER__
#define __RV_MULTIPLEXER__

#include "Headers.hpp"

namespace rv {
/**
 * @brief A callback could not be given a session, window or rendezvous path.
 */
class RoutingError : public std::runtime_error {
 public:
  explicit RoutingError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The terminal multiplexer operations the router relies on.
 */
class Multiplexer {
 public:
  virtual ~Multiplexer() {}

  /**
   * @brief Whether a session with exactly this name exists.
   * @throws RoutingError when the multiplexer cannot be queried.
   */
  virtual bool hasSession(const string& name) = 0;

  /**
   * @brief Creates a detached session.
   * @throws std::runtime_error on failure.
   */
  virtual void newSession(const string& name) = 0;

  /**
   * @brief Creates a window in `session` without switching to it.
   * @return A target naming the window's first pane.
   * @throws std::runtime_error on failure.
   */
  virtual string newWindow(const string& session, const string& window) = 0;

  /**
   * @brief Types `command` into the pane followed by Enter.
   * @throws std::runtime_error on failure.
   */
  virtual void execInPane(const string& paneTarget, const string& command) = 0;
};
}  // namespace rv

#endif  // __RV_MULTIPLEXER__
