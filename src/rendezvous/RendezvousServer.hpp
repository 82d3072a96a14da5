#ifndef __RV_RENDEZVOUS_SERVER__
#define __RV_RENDEZVOUS_SERVER__

#include "Headers.hpp"
#include "IdentityReader.hpp"
#include "PipeSocketHandler.hpp"
#include "SessionRouter.hpp"
#include "SocketBridge.hpp"
#include "SslSocketHandler.hpp"

namespace rv {
/**
 * @brief The bridge never started listening on its rendezvous path.
 */
class DialError : public std::runtime_error {
 public:
  explicit DialError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief How long the listener keeps dialing a freshly routed bridge.
 *
 * The wait between attempts starts at `initialIntervalMs` and doubles up to
 * `maxIntervalMs`.
 */
struct DialPolicy {
  int attempts = 20;
  int initialIntervalMs = 50;
  int maxIntervalMs = 1000;
};

/**
 * @brief Listener role: accepts agent callbacks over TLS and hands each one to
 * a bridge running in its own tmux window.
 *
 * Every accepted connection goes through TLS handshake, identity, routing,
 * dial and relay on its own thread.  A failure before the relay abandons that
 * connection only.
 */
class RendezvousServer {
 public:
  /**
   * @brief Starts listening on `_serverEndpoint`.
   * @throws std::runtime_error when the endpoint cannot be bound.
   */
  RendezvousServer(shared_ptr<SslSocketHandler> _sslSocketHandler,
                   const SocketEndpoint& _serverEndpoint,
                   shared_ptr<PipeSocketHandler> _pipeSocketHandler,
                   shared_ptr<SessionRouter> _router,
                   const DialPolicy& _dialPolicy);
  virtual ~RendezvousServer();

  /**
   * @brief Accept loop.  After shutdown() it stops accepting, shuts down the
   * agent sockets still open, and returns once every connection thread has
   * finished.
   */
  void run();

  /** @brief Makes run() end every connection and return. */
  void shutdown() {
    lock_guard<std::mutex> guard(connectionThreadMutex);
    halt = true;
  }

  /** @brief Drives one accepted connection from handshake to relay end. */
  void handleConnection(int fd);

  /**
   * @brief Connects to the bridge listening on `rendezvousPath`.
   * @throws DialError when the bridge is still unreachable after the last
   * attempt.
   */
  int dial(const string& rendezvousPath);

  /** @brief Connection threads that have not finished yet. */
  int activeConnections();

 protected:
  struct ConnectionThread {
    shared_ptr<thread> t;
    shared_ptr<std::atomic<bool>> done;
  };

  bool isHalted() {
    lock_guard<std::mutex> guard(connectionThreadMutex);
    return halt;
  }
  void acceptNewConnection(int listenFd);
  void reapFinishedThreads();

  shared_ptr<SslSocketHandler> sslSocketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<PipeSocketHandler> pipeSocketHandler;
  shared_ptr<SessionRouter> router;
  DialPolicy dialPolicy;

  /** @brief Guards `connectionThreads` and `halt`. */
  std::mutex connectionThreadMutex;
  vector<ConnectionThread> connectionThreads;
  bool halt = false;
};
}  // namespace rv

#endif  // __RV_RENDEZVOUS_SERVER__
