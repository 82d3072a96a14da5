#ifndef __RV_PIPE_SOCKET_HANDLER__
#define __RV_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace rv {
/**
 * @brief Handles UNIX domain socket connections addressed by a filesystem
 * path (the endpoint name).
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to a pipe identified by the endpoint name.
   * @return The connected fd, or -1 with errno set (ENOENT/ECONNREFUSED while
   * nobody listens on the path yet).
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening UNIX socket and stores it internally.
   * @throws std::runtime_error when the path cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Returns the listening fds for a previously registered pipe.
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the specified pipe and closes its fd.  The
   * socket file itself is left in place.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

  /** @brief Longest path that fits in a sockaddr_un. */
  static size_t maxPathLength();

 protected:
  /** @brief Tracks path -> listening socket descriptors for each pipe. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace rv

#endif  // __RV_PIPE_SOCKET_HANDLER__
