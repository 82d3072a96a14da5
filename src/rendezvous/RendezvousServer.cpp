#include "RendezvousServer.hpp"

namespace rv {
RendezvousServer::RendezvousServer(
    shared_ptr<SslSocketHandler> _sslSocketHandler,
    const SocketEndpoint& _serverEndpoint,
    shared_ptr<PipeSocketHandler> _pipeSocketHandler,
    shared_ptr<SessionRouter> _router, const DialPolicy& _dialPolicy)
    : sslSocketHandler(_sslSocketHandler),
      serverEndpoint(_serverEndpoint),
      pipeSocketHandler(_pipeSocketHandler),
      router(_router),
      dialPolicy(_dialPolicy) {
  sslSocketHandler->listen(serverEndpoint);
  LOG(INFO) << "Listening for agents on " << serverEndpoint;
}

RendezvousServer::~RendezvousServer() {}

void RendezvousServer::run() {
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> serverPortFds = sslSocketHandler->getEndpointFds(serverEndpoint);
  for (int i : serverPortFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }
  if (int(serverPortFds.size()) > FD_SETSIZE) {
    LOG(FATAL) << "Tried to select() on too many FDs";
  }

  while (!isHalted()) {
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet == -1 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet > 0) {
      for (int i : serverPortFds) {
        if (FD_ISSET(i, &rfds)) {
          acceptNewConnection(i);
        }
      }
    }
    reapFinishedThreads();
  }

  LOG(INFO) << "Shutting down listener";
  sslSocketHandler->stopListening(serverEndpoint);
  // Wakes every connection still in its handshake or relay so it can finish.
  for (int fd : sslSocketHandler->getActiveSockets()) {
    sslSocketHandler->shutdownSocket(fd);
  }
  vector<ConnectionThread> remaining;
  {
    lock_guard<std::mutex> guard(connectionThreadMutex);
    remaining.swap(connectionThreads);
  }
  for (auto& it : remaining) {
    it.t->join();
  }
}

void RendezvousServer::acceptNewConnection(int listenFd) {
  int fd = sslSocketHandler->accept(listenFd);
  if (fd < 0) {
    // Nothing to accept or a transient failure; the loop goes on.
    return;
  }
  VLOG(1) << "Accepted agent connection on fd " << fd;
  ConnectionThread connectionThread;
  connectionThread.done.reset(new std::atomic<bool>(false));
  auto done = connectionThread.done;
  connectionThread.t.reset(new thread([this, fd, done]() {
    handleConnection(fd);
    done->store(true);
  }));
  lock_guard<std::mutex> guard(connectionThreadMutex);
  connectionThreads.push_back(connectionThread);
}

void RendezvousServer::reapFinishedThreads() {
  lock_guard<std::mutex> guard(connectionThreadMutex);
  for (auto it = connectionThreads.begin(); it != connectionThreads.end();) {
    if (it->done->load()) {
      it->t->join();
      it = connectionThreads.erase(it);
    } else {
      ++it;
    }
  }
}

int RendezvousServer::activeConnections() {
  lock_guard<std::mutex> guard(connectionThreadMutex);
  int active = 0;
  for (const auto& it : connectionThreads) {
    if (!it.done->load()) {
      active++;
    }
  }
  return active;
}

int RendezvousServer::dial(const string& rendezvousPath) {
  SocketEndpoint bridgeEndpoint;
  bridgeEndpoint.set_name(rendezvousPath);
  int interval = dialPolicy.initialIntervalMs;
  int lastErrno = 0;
  for (int attempt = 1; attempt <= dialPolicy.attempts; attempt++) {
    int fd = pipeSocketHandler->connect(bridgeEndpoint);
    if (fd >= 0) {
      VLOG(1) << "Reached bridge at " << rendezvousPath << " on attempt "
              << attempt;
      return fd;
    }
    lastErrno = GetErrno();
    VLOG(1) << "Bridge at " << rendezvousPath << " not ready ("
            << strerror(lastErrno) << "), attempt " << attempt;
    if (attempt == dialPolicy.attempts) {
      break;
    }
    if (isHalted()) {
      throw DialError("Listener is shutting down");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(interval));
    interval = min(interval * 2, dialPolicy.maxIntervalMs);
  }
  throw DialError("Could not reach bridge at " + rendezvousPath + " after " +
                  to_string(dialPolicy.attempts) +
                  " attempts: " + strerror(lastErrno));
}

void RendezvousServer::handleConnection(int fd) {
  el::Helpers::setThreadName("agent-" + to_string(fd));
  string rendezvousPath;
  int bridgeFd = -1;
  try {
    sslSocketHandler->handshake(fd, SOCKET_DATA_TRANSFER_TIMEOUT);
    AgentIdentity identity = IdentityReader::read(sslSocketHandler, fd);
    el::Helpers::setThreadName(identity.hostname() + "/" +
                               identity.username());
    LOG(INFO) << "Agent " << identity << " connected";
    rendezvousPath = router->route(identity);
    bridgeFd = dial(rendezvousPath);
  } catch (const HandshakeError& he) {
    LOG(ERROR) << "Abandoning connection, bad handshake: " << he.what();
  } catch (const RoutingError& re) {
    LOG(ERROR) << "Abandoning connection, routing failed: " << re.what();
  } catch (const DialError& de) {
    LOG(ERROR) << "Abandoning connection: " << de.what();
    RendezvousPath::remove(rendezvousPath);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Abandoning connection: " << re.what();
    if (!rendezvousPath.empty()) {
      RendezvousPath::remove(rendezvousPath);
    }
  }
  if (bridgeFd < 0) {
    sslSocketHandler->close(fd);
    return;
  }

  SocketBridge::relay(sslSocketHandler, fd, pipeSocketHandler, bridgeFd,
                      rendezvousPath);
}
}  // namespace rv
