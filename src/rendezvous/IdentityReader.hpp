#ifndef __RV_IDENTITY_READER__
#define __RV_IDENTITY_READER__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace rv {
/**
 * @brief The agent did not deliver a usable two-line handshake.
 */
class HandshakeError : public std::runtime_error {
 public:
  explicit HandshakeError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief Makes an agent-supplied line usable as a tmux name and as a path
 * component.
 *
 * Trailing line terminators are dropped, then `.`, `\` and `$` become `_` and
 * a space becomes `-`.  Applying it twice gives the same result as once.
 */
string sanitizeIdentifier(const string& in);

/**
 * @brief Reads the `hostname\nusername\n` handshake an agent sends right after
 * the TLS handshake.
 */
class IdentityReader {
 public:
  /** @brief Longest accepted handshake line, terminator excluded. */
  static const size_t MAX_LINE_LENGTH = 1024;

  /**
   * @brief Reads and sanitizes both lines.
   *
   * Reads one byte at a time so nothing after the second newline is taken
   * off the socket.  Gives up after SOCKET_DATA_TRANSFER_TIMEOUT seconds
   * without progress.
   * @throws HandshakeError when the peer closes, errors, stalls or sends an
   * overlong line.
   */
  static AgentIdentity read(const shared_ptr<SocketHandler>& socketHandler,
                            int fd);

 protected:
  static string readLine(const shared_ptr<SocketHandler>& socketHandler,
                         int fd, const string& field);
};
}  // namespace rv

#endif  // __RV_IDENTITY_READER__
