#ifndef __RV_RAW_SOCKET_UTILS__
#define __RV_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace rv {
/**
 * @brief Blocking loops over plain descriptors (terminals, pipes).
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the whole buffer, retrying on EAGAIN.
   * @throws std::runtime_error when the descriptor is closed or fails.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads exactly `count` bytes.
   * @throws std::runtime_error on EOF or error before `count` bytes arrive.
   */
  static void readAll(int fd, char* buf, size_t count);
};
}  // namespace rv
#endif  // __RV_RAW_SOCKET_UTILS__
