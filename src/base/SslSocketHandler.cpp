#include "SslSocketHandler.hpp"

namespace rv {
SslSocketHandler::SslSocketHandler(const string& certificatePath,
                                   const string& keyPath) {
  OPENSSL_init_ssl(0, NULL);
  ctx = SSL_CTX_new(TLS_server_method());
  if (ctx == NULL) {
    throw std::runtime_error("Could not create TLS context: " +
                             getSslErrors());
  }
  SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
  SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE |
                            SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
  // Agents frequently drop the TCP connection without a close_notify.
  SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

  if (SSL_CTX_use_certificate_chain_file(ctx, certificatePath.c_str()) != 1) {
    string errors = getSslErrors();
    SSL_CTX_free(ctx);
    throw std::runtime_error("Could not load certificate " + certificatePath +
                             ": " + errors);
  }
  if (SSL_CTX_use_PrivateKey_file(ctx, keyPath.c_str(), SSL_FILETYPE_PEM) !=
      1) {
    string errors = getSslErrors();
    SSL_CTX_free(ctx);
    throw std::runtime_error("Could not load private key " + keyPath + ": " +
                             errors);
  }
  if (SSL_CTX_check_private_key(ctx) != 1) {
    string errors = getSslErrors();
    SSL_CTX_free(ctx);
    throw std::runtime_error("Private key " + keyPath +
                             " does not match certificate " + certificatePath +
                             ": " + errors);
  }
  LOG(INFO) << "Loaded TLS key pair " << certificatePath << " " << keyPath;
}

SslSocketHandler::~SslSocketHandler() {
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    for (auto& it : sslSessions) {
      SSL_free(it.second);
    }
    sslSessions.clear();
  }
  SSL_CTX_free(ctx);
}

string SslSocketHandler::getSslErrors() {
  string errors;
  unsigned long e;
  while ((e = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    if (!errors.empty()) {
      errors += "; ";
    }
    errors += buf;
  }
  if (errors.empty()) {
    errors = "unknown error";
  }
  return errors;
}

SSL* SslSocketHandler::getSsl(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = sslSessions.find(fd);
  if (it == sslSessions.end()) {
    return NULL;
  }
  return it->second;
}

int SslSocketHandler::accept(int fd) {
  int clientFd = TcpSocketHandler::accept(fd);
  if (clientFd < 0) {
    return clientFd;
  }
  SSL* ssl = SSL_new(ctx);
  if (ssl == NULL) {
    LOG(ERROR) << "Could not create TLS session: " << getSslErrors();
    TcpSocketHandler::close(clientFd);
    SetErrno(ENOMEM);
    return -1;
  }
  if (SSL_set_fd(ssl, clientFd) != 1) {
    LOG(ERROR) << "Could not attach TLS session: " << getSslErrors();
    SSL_free(ssl);
    TcpSocketHandler::close(clientFd);
    SetErrno(EBADF);
    return -1;
  }
  SSL_set_accept_state(ssl);
  lock_guard<std::recursive_mutex> guard(globalMutex);
  sslSessions[clientFd] = ssl;
  return clientFd;
}

void SslSocketHandler::handshake(int fd, int timeoutSeconds) {
  SSL* ssl = getSsl(fd);
  auto socketMutex = getSocketMutex(fd);
  if (ssl == NULL || !socketMutex) {
    throw std::runtime_error("No TLS session for fd " + to_string(fd));
  }
  time_t deadline = time(NULL) + timeoutSeconds;
  while (true) {
    int err;
    {
      lock_guard<recursive_mutex> guard(*socketMutex);
      ERR_clear_error();
      int rc = SSL_do_handshake(ssl);
      if (rc == 1) {
        VLOG(1) << "TLS handshake complete on " << fd << " using "
                << SSL_get_version(ssl);
        return;
      }
      err = SSL_get_error(ssl, rc);
    }
    if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
      throw std::runtime_error("TLS handshake failed: " + getSslErrors());
    }
    time_t now = time(NULL);
    if (now >= deadline) {
      throw std::runtime_error("TLS handshake timed out");
    }
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(fd, &fdset);
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100 * 1000;
    if (err == SSL_ERROR_WANT_READ) {
      select(fd + 1, &fdset, NULL, NULL, &tv);
    } else {
      select(fd + 1, NULL, &fdset, NULL, &tv);
    }
  }
}

bool SslSocketHandler::hasData(int fd) {
  SSL* ssl = getSsl(fd);
  if (ssl != NULL) {
    auto socketMutex = getSocketMutex(fd);
    if (socketMutex) {
      lock_guard<recursive_mutex> guard(*socketMutex);
      if (SSL_pending(ssl) > 0) {
        return true;
      }
    }
  }
  return TcpSocketHandler::hasData(fd);
}

ssize_t SslSocketHandler::read(int fd, void* buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  SSL* ssl = getSsl(fd);
  auto socketMutex = getSocketMutex(fd);
  if (ssl == NULL || !socketMutex) {
    LOG(INFO) << "Tried to read from a socket that has been closed: " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ERR_clear_error();
  // SSL_ERROR_SYSCALL with errno 0 means EOF, so errno must not be stale.
  SetErrno(0);
  int rc = SSL_read(ssl, buf, int(count));
  if (rc > 0) {
    VLOG(4) << "TLS read " << rc << " bytes from fd: " << fd;
    return rc;
  }
  int err = SSL_get_error(ssl, rc);
  switch (err) {
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
      SetErrno(EAGAIN);
      return -1;
    case SSL_ERROR_ZERO_RETURN:
      VLOG(1) << "TLS peer closed fd " << fd;
      return 0;
    case SSL_ERROR_SYSCALL:
      if (GetErrno() == 0) {
        // EOF without close_notify
        return 0;
      }
      LOG(WARNING) << "Error reading: " << GetErrno() << " "
                   << strerror(GetErrno());
      return -1;
    default:
      LOG(WARNING) << "TLS read error on fd " << fd << ": " << getSslErrors();
      SetErrno(ECONNRESET);
      return -1;
  }
}

ssize_t SslSocketHandler::write(int fd, const void* buf, size_t count) {
  VLOG(4) << "TLS write to fd: " << fd;
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  SSL* ssl = getSsl(fd);
  auto socketMutex = getSocketMutex(fd);
  if (ssl == NULL || !socketMutex) {
    LOG(INFO) << "Tried to write to a socket that has been closed: " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  // Try to write for around 5 seconds before giving up
  time_t startTime = time(NULL);
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    int err;
    {
      lock_guard<recursive_mutex> guard(*socketMutex);
      ERR_clear_error();
      int rc = SSL_write(ssl, ((const char*)buf) + bytesWritten,
                         int(count - bytesWritten));
      if (rc > 0) {
        bytesWritten += rc;
        continue;
      }
      err = SSL_get_error(ssl, rc);
    }
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      if (time(NULL) > startTime + 5) {
        // Give up
        SetErrno(EAGAIN);
        return -1;
      }
      continue;
    }
    VLOG(1) << "TLS write error on fd " << fd << ": " << getSslErrors();
    SetErrno(EPIPE);
    return -1;
  }
  return count;
}

void SslSocketHandler::shutdownSocket(int fd) {
  SSL* ssl = getSsl(fd);
  auto socketMutex = getSocketMutex(fd);
  if (ssl != NULL && socketMutex) {
    lock_guard<recursive_mutex> guard(*socketMutex);
    if (SSL_is_init_finished(ssl) &&
        !(SSL_get_shutdown(ssl) & SSL_SENT_SHUTDOWN)) {
      ERR_clear_error();
      // Best effort: the peer may already be gone.
      SSL_shutdown(ssl);
      ERR_clear_error();
    }
  }
  TcpSocketHandler::shutdownSocket(fd);
}

void SslSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  SSL* ssl = NULL;
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    auto it = sslSessions.find(fd);
    if (it != sslSessions.end()) {
      ssl = it->second;
      sslSessions.erase(it);
    }
  }
  if (ssl != NULL) {
    auto socketMutex = getSocketMutex(fd);
    if (socketMutex) {
      lock_guard<recursive_mutex> guard(*socketMutex);
      if (SSL_is_init_finished(ssl) &&
          !(SSL_get_shutdown(ssl) & SSL_SENT_SHUTDOWN)) {
        ERR_clear_error();
        SSL_shutdown(ssl);
        ERR_clear_error();
      }
    }
    SSL_free(ssl);
  }
  TcpSocketHandler::close(fd);
}
}  // namespace rv
