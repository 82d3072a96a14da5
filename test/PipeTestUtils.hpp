#ifndef __RV_PIPE_TEST_UTILS__
#define __RV_PIPE_TEST_UTILS__

#include "PipeSocketHandler.hpp"
#include "TestHeaders.hpp"

namespace rv {
inline string createTempDirectory(const string& prefix) {
  string tmpPath = GetTempDirectory() + prefix + string("_XXXXXXXX");
  char* dir = mkdtemp(&tmpPath[0]);
  REQUIRE(dir != NULL);
  return string(dir);
}

/**
 * Two connected ends of a unix socket, both owned by `socketHandler`.
 */
struct ConnectedPipe {
  int serverFd;
  int clientFd;
};

inline ConnectedPipe connectPipe(shared_ptr<PipeSocketHandler> socketHandler,
                                 const string& path) {
  SocketEndpoint endpoint;
  endpoint.set_name(path);
  int listenFd = *(socketHandler->listen(endpoint).begin());
  ConnectedPipe pipe;
  pipe.clientFd = socketHandler->connect(endpoint);
  REQUIRE(pipe.clientFd >= 0);
  pipe.serverFd = -1;
  for (int i = 0; i < 100 && pipe.serverFd < 0; i++) {
    pipe.serverFd = socketHandler->accept(listenFd);
    if (pipe.serverFd < 0) {
      ::usleep(10 * 1000);
    }
  }
  REQUIRE(pipe.serverFd >= 0);
  socketHandler->stopListening(endpoint);
  ::unlink(path.c_str());
  return pipe;
}

/**
 * Waits until the peer of `fd` has closed.  Returns false after ~10 seconds.
 */
inline bool waitForEof(shared_ptr<SocketHandler> socketHandler, int fd) {
  char buf[1024];
  for (int i = 0; i < 1000; i++) {
    if (!socketHandler->hasData(fd)) {
      ::usleep(10 * 1000);
      continue;
    }
    ssize_t rc = socketHandler->read(fd, buf, sizeof(buf));
    if (rc == 0) {
      return true;
    }
    if (rc < 0 && GetErrno() != EAGAIN && GetErrno() != EWOULDBLOCK) {
      return true;
    }
  }
  return false;
}

/**
 * Polls `condition` every 10ms for up to ~10 seconds.
 */
template <typename F>
inline bool waitFor(F condition) {
  for (int i = 0; i < 1000; i++) {
    if (condition()) {
      return true;
    }
    ::usleep(10 * 1000);
  }
  return condition();
}
}  // namespace rv

#endif  // __RV_PIPE_TEST_UTILS__
