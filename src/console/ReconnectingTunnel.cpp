#include "ReconnectingTunnel.hpp"

namespace vc {
ReconnectingTunnel::ReconnectingTunnel(shared_ptr<SocketHandler> _socketHandler,
                                       const SocketEndpoint& _endpoint,
                                       const TunnelOptions& _options,
                                       int _localInFd, int _localOutFd)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      options(_options),
      localInFd(_localInFd),
      localOutFd(_localOutFd),
      sleeper([](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
      }),
      connectionCount(0) {}

void ReconnectingTunnel::run() {
  ReconnectPolicy policy(options.initialDelay, options.retryCeiling);
  while (true) {
    int fd = socketHandler->connect(endpoint);
    if (fd < 0) {
      auto localErrno = GetErrno();
      LOG(INFO) << "Could not connect to " << endpoint << ": "
                << strerror(localErrno);
      if (policy.onEvent(TunnelEvent::CONNECT_FAILED) == TunnelAction::GIVE_UP) {
        if (connectionCount > 0) {
          LOG(INFO) << "Console " << endpoint << " went away after "
                    << connectionCount << " connection(s), ending session";
          return;
        }
        stringstream ss;
        ss << "Cannot connect to console " << endpoint << ": "
           << strerror(localErrno);
        throw ConsoleConnectException(ss.str());
      }
      sleeper(policy.getLastSleep());
      continue;
    }

    policy.onEvent(TunnelEvent::CONNECT_SUCCEEDED);
    connectionCount++;
    LOG(INFO) << "Console " << endpoint << " connected (connection "
              << connectionCount << ")";
    try {
      StreamProxy proxy(socketHandler, fd, localInFd, localOutFd,
                        options.blockSize);
      proxy.run();
    } catch (const TunnelBrokenException& tbe) {
      LOG(INFO) << "Tunnel to " << endpoint << " broken: " << tbe.what();
      socketHandler->close(fd);
      policy.onEvent(TunnelEvent::TUNNEL_BROKEN);
      continue;
    } catch (const std::exception& e) {
      STERROR << "Tunnel to " << endpoint << " failed: " << e.what();
      socketHandler->close(fd);
      throw;
    }

    socketHandler->close(fd);
    policy.onEvent(TunnelEvent::SESSION_ENDED);
    return;
  }
}
}  // namespace vc
