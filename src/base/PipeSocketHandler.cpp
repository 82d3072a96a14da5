#include "PipeSocketHandler.hpp"

namespace rv {
PipeSocketHandler::PipeSocketHandler() {}

size_t PipeSocketHandler::maxPathLength() {
  sockaddr_un addr;
  return sizeof(addr.sun_path) - 1;
}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = endpoint.name();
  if (pipePath.length() > maxPathLength()) {
    LOG(ERROR) << "Pipe path is too long: " << pipePath;
    SetErrno(ENAMETOOLONG);
    return -1;
  }
  sockaddr_un remote;
  memset(&remote, 0, sizeof(sockaddr_un));

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, pipePath.c_str(), maxPathLength());

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS && localErrno != EAGAIN) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(sockFd, &fdset);
  timeval tv;
  tv.tv_sec = 3; /* 3 second timeout */
  tv.tv_usec = 0;
  VLOG(4) << "Before selecting sockFd";
  select(sockFd + 1, NULL, &fdset, NULL, &tv);

  if (FD_ISSET(sockFd, &fdset)) {
    VLOG(4) << "sockFd " << sockFd << " is selected";
    int so_error;
    socklen_t len = sizeof so_error;

    FATAL_FAIL(
        ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len));

    if (so_error != 0) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error << " "
                << strerror(so_error);
      FATAL_FAIL(::close(sockFd));
      SetErrno(so_error);
      return -1;
    }
  } else {
    LOG(INFO) << "Timed out connecting to " << endpoint;
    FATAL_FAIL(::close(sockFd));
    SetErrno(ETIMEDOUT);
    return -1;
  }

  LOG(INFO) << "Connected to endpoint " << endpoint << " with fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }
  if (pipePath.empty() || pipePath.length() > maxPathLength()) {
    throw runtime_error("Invalid pipe path: " + pipePath);
  }

  sockaddr_un local;
  memset(&local, 0, sizeof(sockaddr_un));

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  local.sun_family = AF_UNIX; /* local is declared before socket() ^ */
  strncpy(local.sun_path, pipePath.c_str(), maxPathLength());
  unlink(local.sun_path);

  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    throw runtime_error(string("Error binding ") + pipePath + ": " +
                        strerror(localErrno));
  }
  FATAL_FAIL(::listen(fd, 5));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));
  LOG(INFO) << "Listening on " << endpoint;

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) == pipeServerSockets.end()) {
    STFATAL << "Tried to getPipeFd on a pipe without calling listen() first: "
            << pipePath;
  }
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
}
}  // namespace rv
