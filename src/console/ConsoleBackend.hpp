#ifndef __VC_CONSOLE_BACKEND_HPP__
#define __VC_CONSOLE_BACKEND_HPP__

#include "ConsoleConfig.hpp"
#include "Headers.hpp"
#include "SocketBridge.hpp"
#include "SocketHandler.hpp"
#include "SubprocessUtils.hpp"

namespace vc {
/**
 * @brief Thrown when the graphical viewer cannot be started.
 */
class ViewerException : public std::runtime_error {
 public:
  explicit ViewerException(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief The ways ConsoleSelector can open a console.  Every call blocks for
 * the length of the session it starts and throws if the session could not be
 * started.
 */
class ConsoleBackend {
 public:
  virtual ~ConsoleBackend() {}

  /** @brief Attaches the local terminal to a text console. */
  virtual void runTextTunnel(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Makes the Unix-domain console at `path` reachable over TCP.
   * @return The local TCP port.
   */
  virtual int startBridge(const string& path) = 0;
  /** @brief Tears down the bridge created by startBridge(). */
  virtual void stopBridge() = 0;
  /** @brief Runs the graphical viewer against a local TCP port. */
  virtual void launchViewer(int port) = 0;
  /** @brief Returns the fallback console executable, or "" if none exists. */
  virtual string findFallbackConsole() = 0;
  /** @brief Runs the fallback console for `domid` and returns its status. */
  virtual int runFallbackConsole(const string& path, int64_t domid) = 0;
};

/**
 * @brief ConsoleBackend for the local machine: raw terminal + reconnecting
 * tunnel for text, SocketBridge + external viewer for graphics.
 */
class LocalConsoleBackend : public ConsoleBackend {
 public:
  LocalConsoleBackend(shared_ptr<SocketHandler> _pipeSocketHandler,
                      shared_ptr<SocketHandler> _tcpSocketHandler,
                      shared_ptr<SubprocessUtils> _subprocessUtils,
                      const ConsoleConfig& _config);
  virtual ~LocalConsoleBackend();

  virtual void runTextTunnel(const SocketEndpoint& endpoint);
  virtual int startBridge(const string& path);
  virtual void stopBridge();
  virtual void launchViewer(int port);
  virtual string findFallbackConsole();
  virtual int runFallbackConsole(const string& path, int64_t domid);

 protected:
  shared_ptr<SocketHandler> pipeSocketHandler;
  shared_ptr<SocketHandler> tcpSocketHandler;
  shared_ptr<SubprocessUtils> subprocessUtils;
  ConsoleConfig config;
  unique_ptr<SocketBridge> bridge;
};
}  // namespace vc

#endif  // __VC_CONSOLE_BACKEND_HPP__
