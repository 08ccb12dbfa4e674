#include "RawTerminalSession.hpp"

#include "TestHeaders.hpp"

using namespace vc;

namespace {
struct PtyFixture {
  int master;
  int slave;

  PtyFixture() {
    FATAL_FAIL(::openpty(&master, &slave, NULL, NULL, NULL));
  }
  ~PtyFixture() {
    ::close(slave);
    ::close(master);
  }

  termios attributes() const {
    termios t;
    FATAL_FAIL(::tcgetattr(slave, &t));
    return t;
  }
};

bool sameAttributes(const termios& a, const termios& b) {
  return a.c_iflag == b.c_iflag && a.c_oflag == b.c_oflag &&
         a.c_cflag == b.c_cflag && a.c_lflag == b.c_lflag &&
         memcmp(a.c_cc, b.c_cc, sizeof(a.c_cc)) == 0;
}
}  // namespace

TEST_CASE("Raw mode disables line discipline", "[RawTerminalSession]") {
  PtyFixture pty;
  termios before = pty.attributes();
  REQUIRE((before.c_lflag & ICANON) != 0);
  {
    RawTerminalSession session(pty.slave);
    REQUIRE(RawTerminalSession::isActive());
    termios raw = pty.attributes();
    REQUIRE((raw.c_lflag & (ICANON | ECHO | ISIG)) == 0);
    REQUIRE((raw.c_iflag & (ICRNL | IXON)) == 0);
    REQUIRE((raw.c_oflag & OPOST) == 0);
    REQUIRE((raw.c_cflag & CSIZE) == CS8);
    REQUIRE(raw.c_cc[VMIN] == 0);
    REQUIRE(raw.c_cc[VTIME] == 0);
  }
  REQUIRE(!RawTerminalSession::isActive());
  REQUIRE(sameAttributes(before, pty.attributes()));
}

TEST_CASE("Terminal is restored when the action throws",
          "[RawTerminalSession]") {
  PtyFixture pty;
  termios before = pty.attributes();
  REQUIRE_THROWS_AS(withRawTerminal(pty.slave,
                                    []() -> int {
                                      throw std::runtime_error("boom");
                                    }),
                    std::runtime_error);
  REQUIRE(!RawTerminalSession::isActive());
  REQUIRE(sameAttributes(before, pty.attributes()));
}

TEST_CASE("withRawTerminal returns the action's result",
          "[RawTerminalSession]") {
  PtyFixture pty;
  int result = withRawTerminal(pty.slave, [&pty]() {
    return int((pty.attributes().c_lflag & ICANON) == 0);
  });
  REQUIRE(result == 1);
}

TEST_CASE("Non-terminals are rejected", "[RawTerminalSession]") {
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  REQUIRE_THROWS_AS(RawTerminalSession(fds[0]), TerminalException);
  REQUIRE(!RawTerminalSession::isActive());
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("Raw mode cannot be nested", "[RawTerminalSession]") {
  PtyFixture pty;
  PtyFixture other;
  RawTerminalSession session(pty.slave);
  REQUIRE_THROWS_AS(RawTerminalSession(other.slave), TerminalException);
  REQUIRE(RawTerminalSession::isActive());
  // The failed attempt must not touch the second terminal.
  REQUIRE((other.attributes().c_lflag & ICANON) != 0);
}

TEST_CASE("Terminal is restored when the process is signalled",
          "[RawTerminalSession]") {
  int signum = GENERATE(SIGINT, SIGTERM, SIGHUP);
  PtyFixture pty;
  termios before = pty.attributes();

  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    // The same SIGINT handler the command line tool installs.
    ::signal(SIGINT, vc::InterruptSignalHandler);
    try {
      withRawTerminal(pty.slave, [signum]() {
        ::raise(signum);
        // Only reached if the signal did not end the process.
        ::_exit(10);
      });
    } catch (const std::exception&) {
      ::_exit(11);
    }
    ::_exit(12);
  }

  int status = 0;
  REQUIRE(waitpid(pid, &status, 0) == pid);
  REQUIRE(WIFSIGNALED(status));
  REQUIRE(WTERMSIG(status) == signum);
  REQUIRE(sameAttributes(before, pty.attributes()));
}

TEST_CASE("Signal handlers are put back after the session",
          "[RawTerminalSession]") {
  PtyFixture pty;
  struct sigaction before;
  FATAL_FAIL(::sigaction(SIGTERM, NULL, &before));
  {
    RawTerminalSession session(pty.slave);
    struct sigaction during;
    FATAL_FAIL(::sigaction(SIGTERM, NULL, &during));
    REQUIRE(during.sa_handler != before.sa_handler);
  }
  struct sigaction after;
  FATAL_FAIL(::sigaction(SIGTERM, NULL, &after));
  REQUIRE(after.sa_handler == before.sa_handler);
}
