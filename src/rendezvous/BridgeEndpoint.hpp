#ifndef __RV_BRIDGE_ENDPOINT__
#define __RV_BRIDGE_ENDPOINT__

#include "Console.hpp"
#include "Headers.hpp"
#include "PipeSocketHandler.hpp"

namespace rv {
/**
 * @brief Bridge role: waits on the rendezvous path for the listener and ties
 * that single connection to the operator's console.
 */
class BridgeEndpoint {
 public:
  /**
   * @brief Binds the rendezvous path.
   * @throws std::runtime_error when the path cannot be bound.
   */
  BridgeEndpoint(shared_ptr<PipeSocketHandler> _pipeSocketHandler,
                 const SocketEndpoint& _endpoint, shared_ptr<Console> _console);

  /**
   * @brief Waits for the one connection and stops listening.
   * @return The connected fd, or -1 if shutdown() came first.
   */
  int acceptOne();

  /**
   * @brief Accepts, then relays connection -> console output and console
   * input -> connection until either side ends.
   */
  void run();

  void shutdown() {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    shuttingDown = true;
  }

 protected:
  bool isShuttingDown() {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    return shuttingDown;
  }
  void relayToConsole(int fd);

  shared_ptr<PipeSocketHandler> pipeSocketHandler;
  SocketEndpoint endpoint;
  shared_ptr<Console> console;
  bool listening;
  bool shuttingDown;
  recursive_mutex shutdownMutex;
};
}  // namespace rv

#endif  // __RV_BRIDGE_ENDPOINT__
