#ifndef __RV_RENDEZVOUS_PATH__
#define __RV_RENDEZVOUS_PATH__

#include "Headers.hpp"
#include "Multiplexer.hpp"

namespace rv {
/**
 * @brief The working directory that holds rendezvous sockets.
 *
 * Like any directory we hand sockets out of, it must belong to us and must
 * not be writable by anybody else.
 */
class StateDirectory {
 public:
  explicit StateDirectory(const string& _path) : path(_path) {}

  /**
   * @brief Creates the directory with mode 0700 if needed, then verifies it.
   * Crashes when the directory is unusable.
   */
  void createIfRequired();

  const string& getPath() const { return path; }

 protected:
  string path;
};

/**
 * @brief Names for the per-callback Unix sockets the listener and the bridge
 * meet on.
 */
class RendezvousPath {
 public:
  /** @brief How many names to try before giving up. */
  static const int MAX_ATTEMPTS = 100;

  /**
   * @brief Picks an unused absolute path `<dir>/<hint>.<random>.sock`.
   *
   * The name is reserved by creating the file exclusively, then the file is
   * removed again so that the bridge can bind a socket there.
   * @throws RoutingError when no name can be reserved or the path is too long
   * for a Unix socket address.
   */
  static string allocate(const string& stateDirectory, const string& hint);

  /** @brief Unlinks the path.  Missing files are not an error. */
  static void remove(const string& path);
};
}  // namespace rv

#endif  // __RV_RENDEZVOUS_PATH__
