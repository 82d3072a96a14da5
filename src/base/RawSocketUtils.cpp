#include "RawSocketUtils.hpp"

namespace rv {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      throw std::runtime_error(string("Cannot write to descriptor: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to descriptor: closed");
    }
    bytesWritten += rc;
  }
}

void RawSocketUtils::readAll(int fd, char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAll");
  }
  size_t bytesRead = 0;
  while (bytesRead < count) {
    if (!waitOnSocketData(fd)) {
      continue;
    }
    ssize_t rc = ::read(fd, buf + bytesRead, count - bytesRead);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      throw std::runtime_error(string("Cannot read from descriptor: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Descriptor closed before all bytes arrived");
    }
    bytesRead += rc;
  }
}
}  // namespace rv
