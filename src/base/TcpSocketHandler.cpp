#include "TcpSocketHandler.hpp"

namespace vc {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  int sockFd = -1;
  int lastErrno = ECONNREFUSED;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG);
  std::string portname = std::to_string(endpoint.getPort());
  std::string hostname = endpoint.getName();

  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    SetErrno(rc == EAI_NONAME ? EHOSTUNREACH : ENETUNREACH);
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      lastErrno = GetErrno();
      LOG(INFO) << "Error creating socket: " << lastErrno << " "
                << strerror(lastErrno);
      continue;
    }

    // Set nonblocking just for the connect phase
    {
      int opts = fcntl(sockFd, F_GETFL);
      FATAL_FAIL(opts);
      FATAL_FAIL(fcntl(sockFd, F_SETFL, opts | O_NONBLOCK));
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1 &&
        errno != EINPROGRESS) {
      lastErrno = GetErrno();
      LOG(INFO) << "Error connecting to " << endpoint << ": " << lastErrno
                << " " << strerror(lastErrno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
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
      FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &soError, &len));
    }
    if (soError == 0) {
      LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
      break;  // if we get here, we must have connected successfully
    }
    lastErrno = soError;
    LOG(INFO) << "Error connecting to " << endpoint << ": " << soError << " "
              << strerror(soError);
    ::close(sockFd);
    sockFd = -1;
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    SetErrno(lastErrno);
    return -1;
  }
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.getPort();
  auto key = make_pair(endpoint.getName(), port);
  if (port != 0 && portServerSockets.find(key) != portServerSockets.end()) {
    throw std::runtime_error("Tried to listen twice on the same port");
  }

  addrinfo hints, *servinfo, *p;
  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;  // use my IP address when no name is given

  std::string portname = std::to_string(port);
  const char *bindName =
      endpoint.getName().empty() ? NULL : endpoint.getName().c_str();
  int rc = getaddrinfo(bindName, portname.c_str(), &hints, &servinfo);
  if (rc != 0) {
    stringstream oss;
    oss << "Error getting address info for " << endpoint << ": "
        << gai_strerror(rc);
    throw std::runtime_error(oss.str());
  }

  set<int> serverSockets;
  for (p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd;
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket " << p->ai_family << "/"
                << p->ai_socktype << "/" << p->ai_protocol << ": " << errno
                << " " << strerror(errno);
      continue;
    }
    initServerSocket(sockFd);

    if (p->ai_family == AF_INET6) {
      // IPV6 sockets only listen on IPV6 interfaces.  IPV4 gets its own
      // socket.
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      auto localErrno = GetErrno();
      stringstream oss;
      oss << "Error binding " << endpoint << ": " << localErrno << " "
          << strerror(localErrno);
      LOG(ERROR) << oss.str();
      ::close(sockFd);
      for (int fd : serverSockets) {
        ::close(fd);
      }
      freeaddrinfo(servinfo);
      throw std::runtime_error(oss.str());
    }

    FATAL_FAIL(::listen(sockFd, 5));
    LOG(INFO) << "Listening on " << endpoint << " (port "
              << getBoundPort(sockFd) << ", family " << p->ai_family << ")";
    serverSockets.insert(sockFd);
    if (port == 0) {
      // A second ephemeral bind would land on a different port.
      break;
    }
  }
  freeaddrinfo(servinfo);

  if (serverSockets.empty()) {
    throw std::runtime_error("Could not bind to any interface");
  }

  if (port == 0) {
    key.second = getBoundPort(*serverSockets.begin());
  }
  portServerSockets[key] = serverSockets;
  return serverSockets;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  auto it =
      portServerSockets.find(make_pair(endpoint.getName(), endpoint.getPort()));
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a port without calling listen() "
               "first: "
            << endpoint;
  }
  return it->second;
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  auto it =
      portServerSockets.find(make_pair(endpoint.getName(), endpoint.getPort()));
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to stop listening to a port that we weren't listening on: "
            << endpoint;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  portServerSockets.erase(it);
}

int TcpSocketHandler::getBoundPort(int fd) {
  sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  FATAL_FAIL(::getsockname(fd, (sockaddr *)&addr, &len));
  if (addr.ss_family == AF_INET6) {
    return ntohs(((sockaddr_in6 *)&addr)->sin6_port);
  }
  return ntohs(((sockaddr_in *)&addr)->sin_port);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace vc
