#ifndef __RV_CONSOLE__
#define __RV_CONSOLE__

#include "Headers.hpp"
#include "RawSocketUtils.hpp"

namespace rv {
/**
 * @brief The operator's terminal as seen by the bridge.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Prepares the terminal before relaying starts. */
  virtual void setup() = 0;
  /** @brief Restores whatever setup() changed. */
  virtual void teardown() = 0;
  /** @brief Descriptor the operator types into. */
  virtual int getInputFd() = 0;
  /** @brief Descriptor the agent's output is shown on. */
  virtual int getOutputFd() = 0;

  virtual void write(const string& s) {
    RawSocketUtils::writeAll(getOutputFd(), s.data(), s.length());
  }
};
}  // namespace rv

#endif  // __RV_CONSOLE__
