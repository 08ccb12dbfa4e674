#include "SocketBridge.hpp"

#include "ReconnectingTunnel.hpp"
#include "TcpSocketHandler.hpp"

namespace vc {
#define BRIDGE_BUF_SIZE (16 * 1024)

SocketBridge::SocketBridge(shared_ptr<SocketHandler> _pipeSocketHandler,
                           shared_ptr<SocketHandler> _tcpSocketHandler,
                           const string& _bindAddress)
    : pipeSocketHandler(_pipeSocketHandler),
      tcpSocketHandler(_tcpSocketHandler),
      bindAddress(_bindAddress),
      port(-1),
      unixFd(-1),
      listenFd(-1),
      clientFd(-1),
      stopping(false),
      finished(false),
      acceptedClient(false) {
  FATAL_FAIL(::pipe(wakeFds));
}

SocketBridge::~SocketBridge() {
  shutdown();
  ::close(wakeFds[0]);
  ::close(wakeFds[1]);
}

int SocketBridge::start(const string& unixPath) {
  if (bridgeThread.joinable() || finished) {
    throw std::runtime_error("Socket bridge already started");
  }

  unixFd = pipeSocketHandler->connect(SocketEndpoint(unixPath));
  if (unixFd < 0) {
    throw ConsoleConnectException("Cannot connect to console " + unixPath +
                                  ": " + strerror(GetErrno()));
  }

  set<int> listenFds;
  try {
    listenFds = tcpSocketHandler->listen(SocketEndpoint(bindAddress, 0));
  } catch (const std::runtime_error&) {
    pipeSocketHandler->close(unixFd);
    unixFd = -1;
    throw;
  }
  listenFd = *(listenFds.begin());
  port = TcpSocketHandler::getBoundPort(listenFd);
  LOG(INFO) << "Bridging " << unixPath << " to " << bindAddress << ":" << port;

  bridgeThread = std::thread(&SocketBridge::serve, this);
  return port;
}

void SocketBridge::wait() {
  if (bridgeThread.joinable()) {
    bridgeThread.join();
  }
}

void SocketBridge::shutdown() {
  if (!bridgeThread.joinable()) {
    return;
  }
  stopping = true;
  char c = 0;
  if (::write(wakeFds[1], &c, 1) == -1) {
    LOG(WARNING) << "Cannot wake bridge thread: " << strerror(GetErrno());
  }
  stopRelays();
  wait();
}

void SocketBridge::serve() {
  el::Helpers::setThreadName("socket-bridge");
  int fd = acceptClient();
  tcpSocketHandler->stopListening(SocketEndpoint(bindAddress, port));
  listenFd = -1;

  if (fd >= 0) {
    LOG(INFO) << "Bridge client connected on port " << port << " (fd " << fd
              << ")";
    {
      lock_guard<std::mutex> guard(fdMutex);
      clientFd = fd;
    }
    acceptedClient = true;
    if (stopping) {
      stopRelays();
    }
    std::thread toConsole(&SocketBridge::relay, this, tcpSocketHandler, fd,
                          pipeSocketHandler, unixFd, "client->console");
    std::thread toClient(&SocketBridge::relay, this, pipeSocketHandler, unixFd,
                         tcpSocketHandler, fd, "console->client");
    toConsole.join();
    toClient.join();
    {
      lock_guard<std::mutex> guard(fdMutex);
      clientFd = -1;
    }
    tcpSocketHandler->close(fd);
  }

  pipeSocketHandler->close(unixFd);
  {
    lock_guard<std::mutex> guard(fdMutex);
    unixFd = -1;
  }
  finished = true;
  LOG(INFO) << "Bridge on port " << port << " finished";
}

int SocketBridge::acceptClient() {
  while (!stopping) {
    fd_set rfd;
    FD_ZERO(&rfd);
    FD_SET(listenFd, &rfd);
    FD_SET(wakeFds[0], &rfd);
    int rc = select(max(listenFd, wakeFds[0]) + 1, &rfd, NULL, NULL, NULL);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "select failed while waiting for a bridge client: "
              << strerror(GetErrno());
      return -1;
    }
    if (FD_ISSET(wakeFds[0], &rfd)) {
      break;
    }
    if (FD_ISSET(listenFd, &rfd)) {
      int fd = tcpSocketHandler->accept(listenFd);
      if (fd >= 0) {
        return fd;
      }
    }
  }
  VLOG(1) << "Bridge stopped before a client connected";
  return -1;
}

void SocketBridge::relay(shared_ptr<SocketHandler> srcHandler, int srcFd,
                         shared_ptr<SocketHandler> dstHandler, int dstFd,
                         const string& direction) {
  el::Helpers::setThreadName("bridge " + direction);
  char buf[BRIDGE_BUF_SIZE];
  int64_t total = 0;
  while (!stopping) {
    fd_set rfd;
    FD_ZERO(&rfd);
    FD_SET(srcFd, &rfd);
    int rc = select(srcFd + 1, &rfd, NULL, NULL, NULL);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      LOG(INFO) << direction << ": select failed: " << strerror(GetErrno());
      break;
    }
    ssize_t bytesRead = srcHandler->read(srcFd, buf, BRIDGE_BUF_SIZE);
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      LOG(INFO) << direction << ": read failed: " << strerror(localErrno);
      break;
    }
    if (bytesRead == 0) {
      LOG(INFO) << direction << ": end of stream";
      break;
    }
    if (dstHandler->writeAllOrReturn(dstFd, buf, bytesRead) != bytesRead) {
      LOG(INFO) << direction << ": write failed";
      break;
    }
    total += bytesRead;
  }
  VLOG(1) << direction << " relayed " << total << " bytes";
  stopping = true;
  stopRelays();
}

void SocketBridge::stopRelays() {
  lock_guard<std::mutex> guard(fdMutex);
  if (clientFd >= 0) {
    ::shutdown(clientFd, SHUT_RDWR);
    if (unixFd >= 0) {
      ::shutdown(unixFd, SHUT_RDWR);
    }
  }
}
}  // namespace vc
