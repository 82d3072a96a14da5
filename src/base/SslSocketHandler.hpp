#ifndef __RV_SSL_SOCKET_HANDLER__
#define __RV_SSL_SOCKET_HANDLER__

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "TcpSocketHandler.hpp"

namespace rv {
/**
 * @brief TCP server handler whose accepted connections speak TLS.
 *
 * Every fd returned by accept() carries an OpenSSL session in server mode.
 * The TLS handshake is not run inside accept() so that a slow or hostile peer
 * cannot stall the accept loop: the connection's own thread calls handshake()
 * before reading anything.  Reads and writes are serialized per fd by the
 * UnixSocketHandler socket mutex, which lets one thread read while another
 * writes the same connection.
 *
 * close() must not race with read()/write() on the same fd.
 */
class SslSocketHandler : public TcpSocketHandler {
 public:
  /**
   * @brief Loads the PEM certificate chain and private key.
   * @throws std::runtime_error when the key pair cannot be loaded.
   */
  SslSocketHandler(const string& certificatePath, const string& keyPath);
  virtual ~SslSocketHandler();

  /** @brief Accepts a TCP connection and attaches a server TLS session. */
  virtual int accept(int fd);
  /**
   * @brief Completes the TLS server handshake on an accepted fd.
   * @throws std::runtime_error on handshake failure or timeout.
   */
  void handshake(int fd, int timeoutSeconds);
  /** @brief True when decrypted bytes are buffered or the socket is readable.
   */
  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Sends close_notify (if the session is up) and shuts the socket. */
  virtual void shutdownSocket(int fd);
  /** @brief Frees the TLS session and closes the descriptor. */
  virtual void close(int fd);

  /** @brief Returns the queued OpenSSL errors as one string. */
  static string getSslErrors();

 protected:
  SSL* getSsl(int fd);

  SSL_CTX* ctx;
  /** @brief TLS session per accepted fd, guarded by globalMutex. */
  map<int, SSL*> sslSessions;
};
}  // namespace rv

#endif  // __RV_SSL_SOCKET_HANDLER__
