#include "StreamProxy.hpp"

namespace vc {
StreamProxy::StreamProxy(shared_ptr<SocketHandler> _socketHandler,
                         int _remoteFd, int _localInFd, int _localOutFd,
                         size_t blockSize)
    : socketHandler(_socketHandler),
      remoteFd(_remoteFd),
      localInFd(_localInFd),
      localOutFd(_localOutFd),
      toLocal(blockSize),
      toRemote(blockSize),
      finished(false),
      bytesToRemote(0),
      bytesToLocal(0) {}

void StreamProxy::run() {
  VLOG(1) << "Proxying fd " << localInFd << "/" << localOutFd << " <-> "
          << remoteFd;
  while (true) {
    if (!toLocal.empty()) {
      writeToLocal();
    } else if (!toRemote.empty()) {
      writeToRemote();
    } else if (finished) {
      break;
    } else {
      waitAndRead();
    }
  }
  LOG(INFO) << "Proxy finished after " << bytesToRemote << " bytes out and "
            << bytesToLocal << " bytes in";
}

void StreamProxy::writeToLocal() {
  ssize_t rc = ::write(localOutFd, toLocal.readPtr(), toLocal.pending());
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      return;
    }
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      // Non-blocking output: wait until it drains instead of spinning.
      fd_set wfd;
      FD_ZERO(&wfd);
      FD_SET(localOutFd, &wfd);
      select(localOutFd + 1, NULL, &wfd, NULL, NULL);
      return;
    }
    throw std::runtime_error(string("Cannot write to local output: ") +
                             strerror(localErrno));
  }
  if (rc == 0) {
    throw std::runtime_error("Local output closed");
  }
  toLocal.consume(rc);
  bytesToLocal += rc;
}

void StreamProxy::writeToRemote() {
  ssize_t rc =
      socketHandler->write(remoteFd, toRemote.readPtr(), toRemote.pending());
  if (rc < 0) {
    throw TunnelBrokenException(string("Cannot write to console: ") +
                                strerror(GetErrno()));
  }
  toRemote.consume(rc);
  bytesToRemote += rc;
}

void StreamProxy::waitAndRead() {
  fd_set rfd;
  FD_ZERO(&rfd);
  FD_SET(localInFd, &rfd);
  FD_SET(remoteFd, &rfd);
  int maxfd = max(localInFd, remoteFd);
  int rc = select(maxfd + 1, &rfd, NULL, NULL, NULL);
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      return;
    }
    throw std::runtime_error(string("select failed: ") + strerror(localErrno));
  }
  if (FD_ISSET(localInFd, &rfd)) {
    readFromLocal();
  }
  if (FD_ISSET(remoteFd, &rfd)) {
    readFromRemote();
  }
}

void StreamProxy::readFromLocal() {
  ssize_t rc = ::read(localInFd, toRemote.writePtr(), toRemote.room());
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EINTR || localErrno == EAGAIN ||
        localErrno == EWOULDBLOCK) {
      return;
    }
    throw std::runtime_error(string("Cannot read from local input: ") +
                             strerror(localErrno));
  }
  if (rc == 0) {
    LOG(INFO) << "End of local input";
    finished = true;
    return;
  }
  const char* escape = static_cast<const char*>(
      memchr(toRemote.writePtr(), CONSOLE_ESCAPE_BYTE, rc));
  if (escape) {
    // Forward what came before the escape byte, drop the rest.
    rc = escape - toRemote.writePtr();
    LOG(INFO) << "Escape sequence received";
    finished = true;
  }
  toRemote.commit(rc);
}

void StreamProxy::readFromRemote() {
  ssize_t rc = socketHandler->read(remoteFd, toLocal.writePtr(), toLocal.room());
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EINTR || localErrno == EAGAIN ||
        localErrno == EWOULDBLOCK) {
      return;
    }
    throw TunnelBrokenException(string("Cannot read from console: ") +
                                strerror(localErrno));
  }
  if (rc == 0) {
    throw TunnelBrokenException("Console closed the connection");
  }
  toLocal.commit(rc);
}
}  // namespace vc
