#ifndef __RV_TLS_TEST_UTILS__
#define __RV_TLS_TEST_UTILS__

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "TcpSocketHandler.hpp"
#include "TestHeaders.hpp"

namespace rv {
/**
 * Writes a throwaway self-signed `server.pem`/`server.key` pair into `dir`.
 */
inline void generateSelfSignedCertificate(const string& dir) {
  EVP_PKEY_CTX* keyCtx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, NULL);
  REQUIRE(keyCtx != NULL);
  REQUIRE(EVP_PKEY_keygen_init(keyCtx) == 1);
  REQUIRE(EVP_PKEY_CTX_set_rsa_keygen_bits(keyCtx, 2048) == 1);
  EVP_PKEY* pkey = NULL;
  REQUIRE(EVP_PKEY_keygen(keyCtx, &pkey) == 1);
  EVP_PKEY_CTX_free(keyCtx);

  X509* x509 = X509_new();
  REQUIRE(x509 != NULL);
  X509_set_version(x509, 2);
  ASN1_INTEGER_set(X509_get_serialNumber(x509), 1);
  X509_gmtime_adj(X509_getm_notBefore(x509), 0);
  X509_gmtime_adj(X509_getm_notAfter(x509), 24 * 60 * 60);
  X509_set_pubkey(x509, pkey);
  X509_NAME* name = X509_get_subject_name(x509);
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                             (const unsigned char*)"localhost", -1, -1, 0);
  X509_set_issuer_name(x509, name);
  REQUIRE(X509_sign(x509, pkey, EVP_sha256()) > 0);

  FILE* pemFile = fopen((dir + "/server.pem").c_str(), "w");
  REQUIRE(pemFile != NULL);
  REQUIRE(PEM_write_X509(pemFile, x509) == 1);
  fclose(pemFile);

  FILE* keyFile = fopen((dir + "/server.key").c_str(), "w");
  REQUIRE(keyFile != NULL);
  REQUIRE(PEM_write_PrivateKey(keyFile, pkey, NULL, NULL, 0, NULL, NULL) ==
          1);
  fclose(keyFile);

  X509_free(x509);
  EVP_PKEY_free(pkey);
}

/**
 * Blocking TLS client playing the part of an agent.  Reads give up after
 * a few seconds instead of hanging the test.
 */
class TlsTestClient {
 public:
  TlsTestClient()
      : socketHandler(new TcpSocketHandler()), ctx(NULL), ssl(NULL), fd(-1) {}

  ~TlsTestClient() { close(); }

  /** Returns false if the TCP connection or the TLS handshake failed. */
  bool connect(int port) {
    SocketEndpoint endpoint;
    endpoint.set_name("127.0.0.1");
    endpoint.set_port(port);
    fd = socketHandler->connect(endpoint);
    if (fd < 0) {
      return false;
    }
    timeval tv;
    tv.tv_sec = 5;
    tv.tv_usec = 0;
    FATAL_FAIL(setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)));

    ctx = SSL_CTX_new(TLS_client_method());
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, NULL);
    ssl = SSL_new(ctx);
    SSL_set_fd(ssl, fd);
    if (SSL_connect(ssl) != 1) {
      ERR_clear_error();
      return false;
    }
    return true;
  }

  void send(const string& s) {
    REQUIRE(SSL_write(ssl, s.data(), int(s.length())) == int(s.length()));
  }

  /** Reads exactly `count` bytes, or fewer if the server closes first. */
  string receive(int count) {
    string s;
    char buf[4096];
    while (int(s.length()) < count) {
      int rc =
          SSL_read(ssl, buf, min(int(sizeof(buf)), count - int(s.length())));
      if (rc <= 0) {
        ERR_clear_error();
        break;
      }
      s.append(buf, rc);
    }
    return s;
  }

  /** True once the server has closed the connection. */
  bool waitForClose() {
    char c;
    time_t deadline = time(NULL) + 15;
    while (time(NULL) < deadline) {
      int rc = SSL_read(ssl, &c, 1);
      if (rc > 0) {
        continue;
      }
      int localErrno = GetErrno();
      int err = SSL_get_error(ssl, rc);
      ERR_clear_error();
      if (err == SSL_ERROR_WANT_READ ||
          (err == SSL_ERROR_SYSCALL &&
           (localErrno == EAGAIN || localErrno == EWOULDBLOCK))) {
        // SO_RCVTIMEO expired, keep waiting
        continue;
      }
      return true;
    }
    return false;
  }

  /** Half-closes the TCP stream, leaving the read side open. */
  void shutdownWrite() { FATAL_FAIL(::shutdown(fd, SHUT_WR)); }

  /** Drops the TCP connection without a TLS close_notify. */
  void dropWithoutCloseNotify() {
    if (ssl != NULL) {
      SSL_free(ssl);
      ssl = NULL;
    }
    if (fd >= 0) {
      socketHandler->close(fd);
      fd = -1;
    }
  }

  void close() {
    if (ssl != NULL) {
      SSL_shutdown(ssl);
      SSL_free(ssl);
      ssl = NULL;
    }
    if (ctx != NULL) {
      SSL_CTX_free(ctx);
      ctx = NULL;
    }
    if (fd >= 0) {
      socketHandler->close(fd);
      fd = -1;
    }
    ERR_clear_error();
  }

 protected:
  shared_ptr<TcpSocketHandler> socketHandler;
  SSL_CTX* ctx;
  SSL* ssl;
  int fd;
};
}  // namespace rv

#endif  // __RV_TLS_TEST_UTILS__
