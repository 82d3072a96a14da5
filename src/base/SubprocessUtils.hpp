#ifndef __RV_SUBPROCESS_UTILS__
#define __RV_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace rv {
/**
 * @brief Outcome of a finished child process.
 */
struct SubprocessResult {
  /** @brief Exit code, or 128 + signal number when the child was killed. */
  int exitStatus;
  /** @brief Everything the child wrote to stdout. */
  string output;
};

/**
 * @brief Runs external programs without a shell and captures their stdout.
 *
 * Methods are virtual so tests can substitute a scripted implementation.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs `command` with `args`, waiting for it to exit.
   *
   * The child inherits stderr.  An exec failure surfaces as exit status 127.
   * @throws std::runtime_error when the pipe or the child cannot be created.
   */
  virtual SubprocessResult run(const string& command,
                               const vector<string>& args);
};
}  // namespace rv

#endif  // __RV_SUBPROCESS_UTILS__
