#include "BridgeEndpoint.hpp"

#define BUF_SIZE (16 * 1024)

namespace rv {
BridgeEndpoint::BridgeEndpoint(shared_ptr<PipeSocketHandler> _pipeSocketHandler,
                               const SocketEndpoint& _endpoint,
                               shared_ptr<Console> _console)
    : pipeSocketHandler(_pipeSocketHandler),
      endpoint(_endpoint),
      console(_console),
      listening(false),
      shuttingDown(false) {
  pipeSocketHandler->listen(endpoint);
  listening = true;
  LOG(INFO) << "Bridge listening on " << endpoint;
}

int BridgeEndpoint::acceptOne() {
  set<int> listenFds = pipeSocketHandler->getEndpointFds(endpoint);
  int fd = -1;
  while (fd < 0 && !isShuttingDown()) {
    fd_set rfd;
    FD_ZERO(&rfd);
    int maxfd = 0;
    for (int i : listenFds) {
      FD_SET(i, &rfd);
      maxfd = max(maxfd, i);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxfd + 1, &rfd, NULL, NULL, &tv);
    if (numFdsSet == -1 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    for (int i : listenFds) {
      if (FD_ISSET(i, &rfd)) {
        fd = pipeSocketHandler->accept(i);
        if (fd >= 0) {
          break;
        }
      }
    }
  }
  if (listening) {
    // Single use: nobody else may connect after the listener.
    pipeSocketHandler->stopListening(endpoint);
    listening = false;
  }
  if (fd >= 0) {
    LOG(INFO) << "Listener connected on " << endpoint;
  }
  return fd;
}

void BridgeEndpoint::run() {
  int fd = acceptOne();
  if (fd < 0) {
    return;
  }
  console->setup();
  relayToConsole(fd);
  console->teardown();
  pipeSocketHandler->close(fd);
  LOG(INFO) << "Bridge on " << endpoint << " finished";
}

void BridgeEndpoint::relayToConsole(int fd) {
  char b[BUF_SIZE];
  int inputFd = console->getInputFd();
  while (!isShuttingDown()) {
    fd_set rfd;
    timeval tv;
    FD_ZERO(&rfd);
    FD_SET(fd, &rfd);
    FD_SET(inputFd, &rfd);
    int maxfd = max(fd, inputFd);
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxfd + 1, &rfd, NULL, NULL, &tv);
    if (numFdsSet == -1 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);

    if (FD_ISSET(fd, &rfd)) {
      ssize_t rc = pipeSocketHandler->read(fd, b, BUF_SIZE);
      if (rc == 0) {
        LOG(INFO) << "Agent connection closed";
        break;
      }
      if (rc < 0) {
        auto localErrno = GetErrno();
        if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
          LOG(INFO) << "Agent connection failed: " << strerror(localErrno);
          break;
        }
      } else {
        try {
          console->write(string(b, rc));
        } catch (const std::runtime_error& re) {
          LOG(INFO) << "Console output failed: " << re.what();
          break;
        }
        VLOG(4) << "Wrote " << rc << " bytes to the console";
      }
    }

    if (FD_ISSET(inputFd, &rfd)) {
      ssize_t rc = ::read(inputFd, b, BUF_SIZE);
      if (rc == 0) {
        LOG(INFO) << "Console input closed";
        break;
      }
      if (rc < 0) {
        auto localErrno = GetErrno();
        if (localErrno != EAGAIN && localErrno != EWOULDBLOCK &&
            localErrno != EINTR) {
          LOG(INFO) << "Console input failed: " << strerror(localErrno);
          break;
        }
      } else {
        try {
          pipeSocketHandler->writeAllOrThrow(fd, b, rc, false);
        } catch (const std::runtime_error& re) {
          LOG(INFO) << "Agent connection failed: " << re.what();
          break;
        }
        VLOG(4) << "Sent " << rc << " bytes to the agent";
      }
    }
  }
}
}  // namespace rv
