#include "SubprocessUtils.hpp"

namespace rv {
SubprocessResult SubprocessUtils::run(const string& command,
                                      const vector<string>& args) {
  int link[2];
  char buf[4096];
  if (pipe(link) == -1) {
    throw std::runtime_error(string("Could not create pipe: ") +
                             strerror(GetErrno()));
  }

  // Build argv before forking so the child only calls async-signal-safe
  // functions.
  vector<char*> argv;
  argv.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link[1], STDOUT_FILENO);
    ::close(link[0]);
    ::close(link[1]);
    execvp(command.c_str(), argv.data());
    _exit(127);
  } else if (pid < 0) {
    int localErrno = GetErrno();
    ::close(link[0]);
    ::close(link[1]);
    throw std::runtime_error(string("Failed to fork: ") +
                             strerror(localErrno));
  }

  // parent process
  ::close(link[1]);
  SubprocessResult result;
  while (true) {
    ssize_t nbytes = ::read(link[0], buf, sizeof(buf));
    if (nbytes < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    result.output += string(buf, nbytes);
  }
  ::close(link[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      throw std::runtime_error(string("waitpid failed: ") +
                               strerror(GetErrno()));
    }
  }
  if (WIFEXITED(status)) {
    result.exitStatus = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exitStatus = 128 + WTERMSIG(status);
  } else {
    result.exitStatus = -1;
  }
  VLOG(2) << "Subprocess " << command << " exited with "
          << result.exitStatus;
  return result;
}
}  // namespace rv
