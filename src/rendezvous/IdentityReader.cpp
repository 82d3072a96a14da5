#include "IdentityReader.hpp"

namespace rv {
string sanitizeIdentifier(const string& in) {
  string data = in;
  while (!data.empty() && (data.back() == '\n' || data.back() == '\r')) {
    data.pop_back();
  }
  replaceAll(data, ".", "_");
  replaceAll(data, "\\", "_");
  replaceAll(data, " ", "-");
  replaceAll(data, "$", "_");
  return data;
}

string IdentityReader::readLine(const shared_ptr<SocketHandler>& socketHandler,
                                int fd, const string& field) {
  string line;
  while (true) {
    char c;
    try {
      socketHandler->readAll(fd, &c, 1, true);
    } catch (const std::runtime_error& re) {
      throw HandshakeError(field + " read failed: " + re.what());
    }
    if (c == '\n') {
      return line;
    }
    if (line.length() >= MAX_LINE_LENGTH) {
      throw HandshakeError(field + " read failed: line longer than " +
                           to_string(MAX_LINE_LENGTH) + " bytes");
    }
    line.push_back(c);
  }
}

AgentIdentity IdentityReader::read(
    const shared_ptr<SocketHandler>& socketHandler, int fd) {
  AgentIdentity identity;
  identity.set_hostname(
      sanitizeIdentifier(readLine(socketHandler, fd, "hostname")));
  identity.set_username(
      sanitizeIdentifier(readLine(socketHandler, fd, "username")));
  VLOG(1) << "Read agent identity " << identity << " on fd " << fd;
  return identity;
}
}  // namespace rv
