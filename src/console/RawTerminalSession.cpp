#include "RawTerminalSession.hpp"

namespace vc {
namespace {
const int RESTORE_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP};
}

std::atomic<bool> RawTerminalSession::active(false);
volatile sig_atomic_t RawTerminalSession::signalFd = -1;
termios RawTerminalSession::signalAttributes;

RawTerminalSession::RawTerminalSession(int _fd) : fd(_fd) {
  if (!::isatty(fd)) {
    throw TerminalException("Not a terminal: fd " + to_string(fd));
  }
  bool expected = false;
  if (!active.compare_exchange_strong(expected, true)) {
    throw TerminalException("The terminal is already in raw mode");
  }

  if (::tcgetattr(fd, &savedAttributes) == -1) {
    auto localErrno = GetErrno();
    active = false;
    throw TerminalException(string("Cannot read terminal attributes: ") +
                            strerror(localErrno));
  }

  termios rawAttributes = savedAttributes;
  rawAttributes.c_iflag &=
      ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON);
  rawAttributes.c_oflag &= ~OPOST;
  rawAttributes.c_lflag &= ~(ECHO | ECHONL | ICANON | ISIG);
  rawAttributes.c_cflag &= ~(CSIZE | PARENB);
  rawAttributes.c_cflag |= CS8;
  rawAttributes.c_cc[VMIN] = 0;
  rawAttributes.c_cc[VTIME] = 0;

  // Installed before the terminal goes raw.
  installSignalHandlers();
  if (::tcsetattr(fd, TCSANOW, &rawAttributes) == -1) {
    auto localErrno = GetErrno();
    uninstallSignalHandlers();
    active = false;
    throw TerminalException(string("Cannot switch terminal to raw mode: ") +
                            strerror(localErrno));
  }
  VLOG(1) << "Terminal on fd " << fd << " switched to raw mode";
}

RawTerminalSession::~RawTerminalSession() {
  if (::tcsetattr(fd, TCSANOW, &savedAttributes) == -1) {
    STERROR << "Cannot restore terminal attributes: " << strerror(GetErrno());
  } else {
    VLOG(1) << "Terminal on fd " << fd << " restored";
  }
  uninstallSignalHandlers();
  active = false;
}

void RawTerminalSession::restoreOnSignal(int signum) {
  // Only async-signal-safe calls from here on.
  int restoreFd = signalFd;
  if (restoreFd >= 0) {
    ::tcsetattr(restoreFd, TCSANOW, &signalAttributes);
  }
  ::signal(signum, SIG_DFL);
  ::raise(signum);
}

void RawTerminalSession::installSignalHandlers() {
  signalAttributes = savedAttributes;
  signalFd = fd;

  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = RawTerminalSession::restoreOnSignal;
  sigfillset(&action.sa_mask);
  previousActions.resize(sizeof(RESTORE_SIGNALS) / sizeof(RESTORE_SIGNALS[0]));
  for (size_t a = 0; a < previousActions.size(); a++) {
    FATAL_FAIL(::sigaction(RESTORE_SIGNALS[a], &action, &previousActions[a]));
  }
}

void RawTerminalSession::uninstallSignalHandlers() {
  for (size_t a = 0; a < previousActions.size(); a++) {
    FATAL_FAIL(::sigaction(RESTORE_SIGNALS[a], &previousActions[a], NULL));
  }
  previousActions.clear();
  signalFd = -1;
}
}  // namespace vc
