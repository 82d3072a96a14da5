#ifndef __RV_FAKE_CONSOLE__
#define __RV_FAKE_CONSOLE__

#include "Console.hpp"
#include "RawSocketUtils.hpp"

namespace rv {
/**
 * Console backed by two pipes: the test types into one and reads what the
 * bridge printed from the other.
 */
class FakeConsole : public Console {
 public:
  FakeConsole() : setupCount(0), teardownCount(0) {
    FATAL_FAIL(::pipe(inputPipe));
    FATAL_FAIL(::pipe(outputPipe));
  }

  virtual ~FakeConsole() {
    closeInput();
    for (int fd : {inputPipe[0], outputPipe[0], outputPipe[1]}) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
  }

  virtual void setup() { setupCount++; }

  virtual void teardown() { teardownCount++; }

  virtual int getInputFd() { return inputPipe[0]; }

  virtual int getOutputFd() { return outputPipe[1]; }

  void simulateKeystrokes(const string& s) {
    RawSocketUtils::writeAll(inputPipe[1], s.data(), s.length());
  }

  string getTerminalData(int count) {
    string s(count, '\0');
    RawSocketUtils::readAll(outputPipe[0], &s[0], count);
    return s;
  }

  /** Simulates the operator's stdin reaching EOF. */
  void closeInput() {
    if (inputPipe[1] >= 0) {
      ::close(inputPipe[1]);
      inputPipe[1] = -1;
    }
  }

  std::atomic<int> setupCount;
  std::atomic<int> teardownCount;

 protected:
  int inputPipe[2];
  int outputPipe[2];
};
}  // namespace rv

#endif  // __RV_FAKE_CONSOLE__
