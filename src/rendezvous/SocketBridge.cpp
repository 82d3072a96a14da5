#include "SocketBridge.hpp"

#include "RendezvousPath.hpp"

#define BUF_SIZE (16 * 1024)

namespace rv {
int64_t SocketBridge::copy(const shared_ptr<SocketHandler>& source,
                           int sourceFd,
                           const shared_ptr<SocketHandler>& destination,
                           int destinationFd, std::atomic<bool>* stop,
                           const string& direction) {
  char buf[BUF_SIZE];
  int64_t total = 0;
  while (!stop->load()) {
    if (!source->hasData(sourceFd)) {
      fd_set rfd;
      FD_ZERO(&rfd);
      FD_SET(sourceFd, &rfd);
      timeval tv;
      tv.tv_sec = 0;
      tv.tv_usec = 10000;
      select(sourceFd + 1, &rfd, NULL, NULL, &tv);
      continue;
    }
    ssize_t bytesRead = source->read(sourceFd, buf, BUF_SIZE);
    if (bytesRead == 0) {
      LOG(INFO) << direction << ": end of stream";
      break;
    }
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        continue;
      }
      LOG(INFO) << direction << ": read failed: " << strerror(localErrno);
      break;
    }
    try {
      destination->writeAllOrThrow(destinationFd, buf, bytesRead, false);
    } catch (const std::runtime_error& re) {
      LOG(INFO) << direction << ": write failed: " << re.what();
      break;
    }
    total += bytesRead;
    VLOG(4) << direction << ": relayed " << bytesRead << " bytes";
  }
  return total;
}

RelayStats SocketBridge::relay(shared_ptr<SocketHandler> handlerA, int fdA,
                               shared_ptr<SocketHandler> handlerB, int fdB,
                               const string& rendezvousPath) {
  RelayStats stats;
  std::atomic<bool> stop(false);
  auto stopBoth = [&]() {
    stop.store(true);
    // Wakes the other direction if it is blocked on either socket.
    handlerA->shutdownSocket(fdA);
    handlerB->shutdownSocket(fdB);
  };

  thread aToB([&]() {
    stats.aToB = copy(handlerA, fdA, handlerB, fdB, &stop,
                      to_string(fdA) + "->" + to_string(fdB));
    stopBoth();
  });
  thread bToA([&]() {
    stats.bToA = copy(handlerB, fdB, handlerA, fdA, &stop,
                      to_string(fdB) + "->" + to_string(fdA));
    stopBoth();
  });
  aToB.join();
  bToA.join();

  handlerA->close(fdA);
  handlerB->close(fdB);
  if (!rendezvousPath.empty()) {
    RendezvousPath::remove(rendezvousPath);
  }
  LOG(INFO) << "Relay finished, " << stats.aToB << " bytes from " << fdA
            << ", " << stats.bToA << " bytes from " << fdB;
  return stats;
}
}  // namespace rv
