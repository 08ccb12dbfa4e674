#include "ConsoleBackend.hpp"

#include "RawTerminalSession.hpp"
#include "ReconnectingTunnel.hpp"

namespace vc {
LocalConsoleBackend::LocalConsoleBackend(
    shared_ptr<SocketHandler> _pipeSocketHandler,
    shared_ptr<SocketHandler> _tcpSocketHandler,
    shared_ptr<SubprocessUtils> _subprocessUtils, const ConsoleConfig& _config)
    : pipeSocketHandler(_pipeSocketHandler),
      tcpSocketHandler(_tcpSocketHandler),
      subprocessUtils(_subprocessUtils),
      config(_config) {}

LocalConsoleBackend::~LocalConsoleBackend() { stopBridge(); }

void LocalConsoleBackend::runTextTunnel(const SocketEndpoint& endpoint) {
  auto socketHandler =
      endpoint.isUnixPath() ? pipeSocketHandler : tcpSocketHandler;
  ReconnectingTunnel tunnel(socketHandler, endpoint, config.tunnel);
  // One raw session for the whole retry loop.
  withRawTerminal(STDIN_FILENO, [&tunnel]() { tunnel.run(); });
}

int LocalConsoleBackend::startBridge(const string& path) {
  stopBridge();
  bridge.reset(new SocketBridge(pipeSocketHandler, tcpSocketHandler,
                                config.bridgeBindAddress));
  return bridge->start(path);
}

void LocalConsoleBackend::stopBridge() {
  if (bridge) {
    bridge->shutdown();
    bridge.reset();
  }
}

void LocalConsoleBackend::launchViewer(int port) {
  string viewer = subprocessUtils->findExecutable(config.viewerBinary);
  if (viewer.empty()) {
    throw ViewerException("Cannot find viewer " + config.viewerBinary);
  }
  if (config.viewerStartupDelay.count() > 0) {
    std::this_thread::sleep_for(config.viewerStartupDelay);
  }
  string address = config.viewerHost + ":" + to_string(port);
  LOG(INFO) << "Starting " << viewer << " " << address;
  int status = subprocessUtils->runAndWait(viewer, {address});
  if (status == 127) {
    throw ViewerException("Cannot run viewer " + viewer);
  }
  if (status != 0) {
    LOG(WARNING) << viewer << " exited with status " << status;
  }
}

string LocalConsoleBackend::findFallbackConsole() {
  for (const auto& path : config.fallbackPaths) {
    if (subprocessUtils->isExecutable(path)) {
      return path;
    }
    VLOG(1) << "No fallback console at " << path;
  }
  return "";
}

int LocalConsoleBackend::runFallbackConsole(const string& path,
                                            int64_t domid) {
  return subprocessUtils->runAndWait(path, {to_string(domid)});
}
}  // namespace vc
