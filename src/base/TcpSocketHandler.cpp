#include "TcpSocketHandler.hpp"

namespace rv {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *results = NULL;
  int rc = getaddrinfo(endpoint.name().c_str(),
                       to_string(endpoint.port()).c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Cannot resolve " << endpoint << ": " << gai_strerror(rc);
    return -1;
  }

  int sockFd = -1;
  for (addrinfo *p = results; p != NULL && sockFd < 0; p = p->ai_next) {
    sockFd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd < 0) {
      continue;
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      auto localErrno = GetErrno();
      LOG(INFO) << "Error connecting to " << endpoint << ": "
                << strerror(localErrno);
      ::close(sockFd);
      sockFd = -1;
      SetErrno(localErrno);
    }
  }
  freeaddrinfo(results);

  if (sockFd >= 0) {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    addToActiveSockets(sockFd);
    LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
  }
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) != portServerSockets.end()) {
    throw std::runtime_error("Tried to listen twice on the same port");
  }

  addrinfo hints, *servinfo, *p;
  int rc;

  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;  // use my IP address when no name is given

  std::string portname = std::to_string(port);
  const char *bindName =
      endpoint.has_name() && !endpoint.name().empty() ? endpoint.name().c_str()
                                                      : NULL;

  if ((rc = getaddrinfo(bindName, portname.c_str(), &hints, &servinfo)) != 0) {
    stringstream oss;
    oss << "Error getting address info for " << endpoint << ": " << rc << " ("
        << gai_strerror(rc) << ")";
    throw std::runtime_error(oss.str());
  }

  set<int> serverSockets;
  // loop through all the results and bind to each we can
  for (p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd;
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket " << p->ai_family << "/"
                << p->ai_socktype << "/" << p->ai_protocol << ": " << errno
                << " " << strerror(errno);
      continue;
    }
    initServerSocket(sockFd);

    if (p->ai_family == AF_INET6) {
      // Also ensure that IPV6 sockets only listen on IPV6
      // interfaces.  We will create another socket object for IPV4
      // if it doesn't already exist.
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      // This most often happens because the port is in use.
      auto localErrno = errno;
      LOG(ERROR) << "Error binding " << p->ai_family << "/" << p->ai_socktype
                 << "/" << p->ai_protocol << ": " << localErrno << " "
                 << strerror(localErrno);
      stringstream oss;
      oss << "Error binding " << endpoint << ": " << localErrno << " "
          << strerror(localErrno);
      ::close(sockFd);
      for (int fd : serverSockets) {
        ::close(fd);
      }
      freeaddrinfo(servinfo);
      throw std::runtime_error(oss.str());
    }

    // Listen
    FATAL_FAIL(::listen(sockFd, 32));
    LOG(INFO) << "Listening on " << endpoint << "/" << p->ai_family << "/"
              << p->ai_socktype << "/" << p->ai_protocol;

    // if we get here, we must have connected successfully
    serverSockets.insert(sockFd);
  }
  freeaddrinfo(servinfo);

  if (serverSockets.empty()) {
    throw std::runtime_error("Could not bind to any interface!");
  }

  portServerSockets[port] = serverSockets;
  return serverSockets;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) == portServerSockets.end()) {
    STFATAL
        << "Tried to getEndpointFds on a port without calling listen() first";
  }
  return portServerSockets[port];
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  auto it = portServerSockets.find(port);
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to stop listening to a port that we weren't listening on";
  }
  auto &serverSockets = it->second;
  for (int sockFd : serverSockets) {
    FATAL_FAIL(::close(sockFd));
  }
  portServerSockets.erase(it);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace rv
