#ifndef __RV_PSEUDO_TERMINAL_CONSOLE__
#define __RV_PSEUDO_TERMINAL_CONSOLE__

#include "Console.hpp"

namespace rv {
/**
 * @brief stdin/stdout of the tmux pane the bridge runs in.
 *
 * The terminal stays cooked unless `raw` is set, in which case setup() puts
 * it in raw mode and teardown() restores the saved settings.
 */
class PseudoTerminalConsole : public Console {
 public:
  explicit PseudoTerminalConsole(bool _raw) : raw(_raw), modified(false) {}

  virtual ~PseudoTerminalConsole() {}

  virtual void setup() {
    if (!raw || !isatty(STDIN_FILENO)) {
      return;
    }
    termios terminal_local;
    FATAL_FAIL(tcgetattr(STDIN_FILENO, &terminal_local));
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    FATAL_FAIL(tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local));
    modified = true;
  }

  virtual void teardown() {
    if (modified) {
      tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
      modified = false;
    }
  }

  virtual int getInputFd() { return STDIN_FILENO; }

  virtual int getOutputFd() { return STDOUT_FILENO; }

 protected:
  bool raw;
  bool modified;
  termios terminal_backup;
};
}  // namespace rv

#endif  // __RV_PSEUDO_TERMINAL_CONSOLE__
