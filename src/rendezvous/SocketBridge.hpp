#ifndef __RV_SOCKET_BRIDGE__
#define __RV_SOCKET_BRIDGE__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace rv {
/**
 * @brief Bytes moved in each direction by SocketBridge::relay().
 */
struct RelayStats {
  int64_t aToB = 0;
  int64_t bToA = 0;
};

/**
 * @brief Splices two connected sockets together until either side ends.
 */
class SocketBridge {
 public:
  /**
   * @brief Copies A to B and B to A on two threads.
   *
   * When either direction stops (EOF or error) both sockets are shut down so
   * the other direction stops too.  Returns after both threads have
   * finished, with both fds closed and `rendezvousPath` (if not empty)
   * removed.
   */
  static RelayStats relay(shared_ptr<SocketHandler> handlerA, int fdA,
                          shared_ptr<SocketHandler> handlerB, int fdB,
                          const string& rendezvousPath);

 protected:
  static int64_t copy(const shared_ptr<SocketHandler>& source, int sourceFd,
                      const shared_ptr<SocketHandler>& destination,
                      int destinationFd, std::atomic<bool>* stop,
                      const string& direction);
};
}  // namespace rv

#endif  // __RV_SOCKET_BRIDGE__
