#ifndef __VC_RAW_TERMINAL_SESSION_HPP__
#define __VC_RAW_TERMINAL_SESSION_HPP__

#include "Headers.hpp"

namespace vc {
/**
 * @brief Thrown when the terminal cannot be switched to (or back from) raw
 * mode.
 */
class TerminalException : public std::runtime_error {
 public:
  explicit TerminalException(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Puts a terminal into raw passthrough mode for the lifetime of the
 * object and restores the saved attributes when it goes away.
 *
 * Raw here means no input/output processing, no echo, no line buffering and
 * no signals from control characters, so Control+C and friends reach the
 * console unmodified.  Reads return immediately (VMIN = 0, VTIME = 0).
 *
 * Only one session may be active per process.  While it is active, SIGINT,
 * SIGTERM and SIGHUP restore the terminal before their default action runs.
 */
class RawTerminalSession {
 public:
  /**
   * @throws TerminalException if `fd` is not a terminal, its attributes
   * cannot be changed, or another session is already active.
   */
  explicit RawTerminalSession(int fd = STDIN_FILENO);
  ~RawTerminalSession();

  RawTerminalSession(const RawTerminalSession&) = delete;
  RawTerminalSession& operator=(const RawTerminalSession&) = delete;

  int getFd() const { return fd; }

  /** @brief Returns true while some RawTerminalSession is alive. */
  static bool isActive() { return active.load(); }

 protected:
  static void restoreOnSignal(int signum);
  void installSignalHandlers();
  void uninstallSignalHandlers();

  int fd;
  termios savedAttributes;
  vector<struct sigaction> previousActions;

  static std::atomic<bool> active;
  // Copies of fd/savedAttributes readable from a signal handler.
  static volatile sig_atomic_t signalFd;
  static termios signalAttributes;
};

/**
 * @brief Runs `action` with `fd` in raw mode, restoring the terminal whether
 * `action` returns or throws.
 */
template <typename F>
inline auto withRawTerminal(int fd, F&& action) -> decltype(action()) {
  RawTerminalSession session(fd);
  return action();
}
}  // namespace vc

#endif  // __VC_RAW_TERMINAL_SESSION_HPP__
