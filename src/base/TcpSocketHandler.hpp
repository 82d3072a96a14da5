#ifndef __RV_TCP_SOCKET_HANDLER__
#define __RV_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace rv {
/**
 * @brief Implements IPv4/IPv6 socket operations built on top of
 * UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects.  The returned socket is
   * blocking.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the endpoint's address (all addresses when the
   * endpoint has no name) for the given port.
   * @throws std::runtime_error when the address cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Returns the listening socket fds associated with a port.
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the requested port and closes all related fds.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks all listening sockets created per TCP port. */
  map<int, set<int>> portServerSockets;

  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace rv

#endif  // __RV_TCP_SOCKET_HANDLER__
