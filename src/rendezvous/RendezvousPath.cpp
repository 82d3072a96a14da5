#include "RendezvousPath.hpp"

#include "PipeSocketHandler.hpp"

namespace rv {
void StateDirectory::createIfRequired() {
  // Reset umask to 0 while creating the directory, and restore after.
  const mode_t oldMode = ::umask(0);
  if (::mkdir(path.c_str(), 0700) == -1) {
    // Permit EEXIST if the directory already exists.
    CHECK_EQ(errno, EEXIST)
        << "Unexpected result creating " << path << ": " << strerror(errno);
  }
  CHECK_EQ(::umask(oldMode), 0)
      << "Unexpected result when restoring umask, which should return the "
         "previous overridden value (0).";

  struct stat stateStat;
  if (::stat(path.c_str(), &stateStat) != 0) {
    LOG(FATAL) << "Failed to create state directory: " << path << "\n"
               << "Error: " << strerror(errno);
  }

  if (stateStat.st_uid != ::geteuid()) {
    LOG(FATAL) << "State directory must be owned by the current user: "
               << path << "\n"
               << "Expected euid=" << ::geteuid()
               << ", actual=" << stateStat.st_uid;
  }

  if (!S_ISDIR(stateStat.st_mode)) {
    LOG(FATAL) << "State directory must be a directory: " << path;
  }

  if ((stateStat.st_mode & (S_IWGRP | S_IWOTH)) != 0) {
    LOG(FATAL) << "State directory must not provide write access to "
                  "group/other: "
               << path;
  }
}

string RendezvousPath::allocate(const string& stateDirectory,
                                const string& hint) {
  string candidate;
  bool reserved = false;
  for (int attempt = 0; attempt < MAX_ATTEMPTS; attempt++) {
    candidate = stateDirectory + "/" + hint + "." + genRandomAlphaNum(10) +
                ".sock";
    int fd = ::open(candidate.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_NOFOLLOW,
                    0600);
    if (fd >= 0) {
      FATAL_FAIL(::close(fd));
      reserved = true;
      break;
    }
    if (GetErrno() != EEXIST) {
      throw RoutingError("Could not reserve a rendezvous path in " +
                         stateDirectory + ": " + strerror(GetErrno()));
    }
  }
  if (!reserved) {
    throw RoutingError("Could not find a free rendezvous path in " +
                       stateDirectory + " after " + to_string(MAX_ATTEMPTS) +
                       " attempts");
  }

  // Only the unique name is wanted: the bridge binds a socket here.
  remove(candidate);

  string absolutePath;
  try {
    absolutePath = fs::absolute(candidate).string();
  } catch (const fs::filesystem_error& fse) {
    throw RoutingError(string("Could not resolve rendezvous path: ") +
                       fse.what());
  }
  if (absolutePath.length() > PipeSocketHandler::maxPathLength()) {
    throw RoutingError("Rendezvous path is too long for a unix socket: " +
                       absolutePath);
  }
  return absolutePath;
}

void RendezvousPath::remove(const string& path) {
  if (::unlink(path.c_str()) == -1 && GetErrno() != ENOENT) {
    LOG(WARNING) << "Could not remove " << path << ": "
                 << strerror(GetErrno());
  }
}
}  // namespace rv
