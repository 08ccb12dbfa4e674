#include "PipeSocketHandler.hpp"

namespace vc {
PipeSocketHandler::PipeSocketHandler() {}

bool PipeSocketHandler::fillAddress(const string& path, sockaddr_un* addr) {
  memset(addr, 0, sizeof(sockaddr_un));
  addr->sun_family = AF_UNIX;
  if (path.empty() || path.length() >= sizeof(addr->sun_path)) {
    SetErrno(path.empty() ? ENOENT : ENAMETOOLONG);
    return false;
  }
  strncpy(addr->sun_path, path.c_str(), sizeof(addr->sun_path) - 1);
  return true;
}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  sockaddr_un remote;
  if (!fillAddress(endpoint.getName(), &remote)) {
    LOG(INFO) << "Invalid socket path: " << endpoint;
    return -1;
  }

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS && localErrno != EAGAIN) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  if (result < 0) {
    // The listen backlog is full: give the server a moment to accept.
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    timeval tv;
    tv.tv_sec = 3; /* 3 second timeout */
    tv.tv_usec = 0;
    select(sockFd + 1, NULL, &fdset, NULL, &tv);

    int soError = ETIMEDOUT;
    if (FD_ISSET(sockFd, &fdset)) {
      socklen_t len = sizeof soError;
      FATAL_FAIL(
          ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char*)&soError, &len));
    }
    if (soError != 0) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << soError << " "
                << strerror(soError);
      FATAL_FAIL(::close(sockFd));
      SetErrno(soError);
      return -1;
    }
  }

  LOG(INFO) << "Connected to endpoint " << endpoint << " using fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  if (!fillAddress(pipePath, &local)) {
    throw runtime_error("Invalid socket path: " + pipePath);
  }

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  unlink(local.sun_path);

  FATAL_FAIL(::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)));
  FATAL_FAIL(::listen(fd, 5));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  if (pipeServerSockets.find(pipePath) == pipeServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a pipe without calling listen() "
               "first: "
            << pipePath;
  }
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
  ::unlink(pipePath.c_str());
}
}  // namespace vc
