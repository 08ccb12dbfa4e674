#ifndef __VC_TEST_HEADERS__
#define __VC_TEST_HEADERS__

#include <catch2/catch_all.hpp>

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace vc {
// Makes a fresh directory under the temp dir for sockets and scripts.
inline string makeTestDirectory(const string &prefix) {
  string pattern = GetTempDirectory() + prefix + "_XXXXXXXX";
  char *dir = mkdtemp(&pattern[0]);
  if (dir == NULL) {
    throw std::runtime_error("mkdtemp failed: " + string(strerror(errno)));
  }
  return string(dir);
}

// Writes an executable shell script and returns its path.
inline string writeTestScript(const string &directory, const string &name,
                              const string &body) {
  string path = directory + "/" + name;
  {
    ofstream out(path);
    out << "#!/bin/sh\n" << body << "\n";
  }
  fs::permissions(path, fs::perms::owner_all);
  return path;
}

// Accepts one client on a nonblocking listen fd, failing after ~5 seconds.
inline int acceptWithTimeout(shared_ptr<SocketHandler> socketHandler,
                             int listenFd) {
  for (int a = 0; a < 500; a++) {
    int fd = socketHandler->accept(listenFd);
    if (fd >= 0) {
      return fd;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  throw std::runtime_error("Timed out waiting for a client");
}

// Reads from a raw fd until `count` bytes arrived.
inline string readExactly(int fd, size_t count) {
  string result;
  char buf[4096];
  while (result.size() < count) {
    ssize_t rc = ::read(fd, buf, min(sizeof(buf), count - result.size()));
    if (rc < 0 && (errno == EINTR || errno == EAGAIN)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }
    if (rc <= 0) {
      throw std::runtime_error("Short read from test fd");
    }
    result.append(buf, rc);
  }
  return result;
}

// True if fd becomes readable (data or EOF) within timeoutMs.
inline bool hasSocketData(int fd, int timeoutMs = 0) {
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(fd, &readfds);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = ::select(fd + 1, &readfds, NULL, NULL, &tv);
  if (rc < 0) {
    throw std::runtime_error("select failed: " + string(strerror(errno)));
  }
  return rc > 0;
}

// Writes every byte of data through the handler or throws.
inline void writeAllToSocket(shared_ptr<SocketHandler> socketHandler, int fd,
                             const string &data) {
  if (socketHandler->writeAllOrReturn(fd, data.c_str(), data.length()) !=
      int(data.length())) {
    throw std::runtime_error("Failed to write test data");
  }
}

// Reads exactly count bytes through the handler, failing after ~5 seconds
// or on EOF.
inline string readFromSocket(shared_ptr<SocketHandler> socketHandler, int fd,
                             size_t count) {
  string result;
  char buf[4096];
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (result.size() < count) {
    if (std::chrono::steady_clock::now() > deadline) {
      throw std::runtime_error("Timed out reading test data");
    }
    if (!hasSocketData(fd, 10)) {
      continue;
    }
    ssize_t rc =
        socketHandler->read(fd, buf, min(sizeof(buf), count - result.size()));
    if (rc < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
      continue;
    }
    if (rc <= 0) {
      throw std::runtime_error("Short read from test socket");
    }
    result.append(buf, rc);
  }
  return result;
}

// Number of descriptors this process has open.
inline size_t countOpenFds() {
  size_t count = 0;
  for (const auto &entry : fs::directory_iterator("/proc/self/fd")) {
    (void)entry;
    count++;
  }
  return count;
}
}  // namespace vc

#endif  // __VC_TEST_HEADERS__
