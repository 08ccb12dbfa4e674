#include "ConsoleSelector.hpp"

#include "ConsoleDescriptors.hpp"
#include "PipeSocketHandler.hpp"
#include "ReconnectingTunnel.hpp"
#include "TestHeaders.hpp"

using namespace vc;

namespace {
// Records every call and fails the endpoints it is told to fail.
class FakeConsoleBackend : public ConsoleBackend {
 public:
  FakeConsoleBackend() : fallbackPath(""), fallbackStatus(0) {}

  virtual void runTextTunnel(const SocketEndpoint& endpoint) {
    stringstream ss;
    ss << "text " << endpoint;
    calls.push_back(ss.str());
    if (failing.count(ss.str())) {
      throw ConsoleConnectException("unreachable");
    }
  }

  virtual int startBridge(const string& path) {
    calls.push_back("bridge " + path);
    if (failing.count("bridge " + path)) {
      throw ConsoleConnectException("unreachable");
    }
    return 6000;
  }

  virtual void stopBridge() { calls.push_back("stop bridge"); }

  virtual void launchViewer(int port) {
    string call = "viewer " + to_string(port);
    calls.push_back(call);
    if (failing.count(call)) {
      throw ViewerException("no viewer");
    }
  }

  virtual string findFallbackConsole() { return fallbackPath; }

  virtual int runFallbackConsole(const string& path, int64_t domid) {
    calls.push_back("fallback " + path + " " + to_string(domid));
    return fallbackStatus;
  }

  vector<string> calls;
  set<string> failing;
  string fallbackPath;
  int fallbackStatus;
};

// Runs a real tunnel over pipes for text consoles and fakes the rest.
class PipeTunnelBackend : public FakeConsoleBackend {
 public:
  PipeTunnelBackend() : socketHandler(new PipeSocketHandler()) {
    FATAL_FAIL(::pipe(stdinPipe));
    FATAL_FAIL(::pipe(stdoutPipe));
  }

  virtual ~PipeTunnelBackend() {
    for (int fd : {stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1]}) {
      ::close(fd);
    }
  }

  virtual void runTextTunnel(const SocketEndpoint& endpoint) {
    stringstream ss;
    ss << "text " << endpoint;
    calls.push_back(ss.str());
    ReconnectingTunnel tunnel(socketHandler, endpoint, TunnelOptions(),
                              stdinPipe[0], stdoutPipe[1]);
    tunnel.setSleeper([](std::chrono::milliseconds) {});
    tunnel.run();
  }

  shared_ptr<SocketHandler> socketHandler;
  int stdinPipe[2];
  int stdoutPipe[2];
};

ConsoleDescriptor* addConsole(ConsoleList* consoles, ConsoleProtocol protocol,
                              const string& path, int port) {
  auto* descriptor = consoles->add_consoles();
  descriptor->set_protocol(protocol);
  descriptor->set_path(path);
  descriptor->set_port(port);
  return descriptor;
}
}  // namespace

TEST_CASE("Text consoles are preferred in a stable order",
          "[ConsoleSelector]") {
  ConsoleList consoles;
  addConsole(&consoles, GRAPHICAL, "/g1", 0);
  addConsole(&consoles, TEXT, "/t1", 0);
  addConsole(&consoles, GRAPHICAL, "", 5901);
  addConsole(&consoles, TEXT, "", 2300);

  auto ordered = ConsoleSelector::orderByPreference(consoles);
  REQUIRE(ordered.size() == 4);
  REQUIRE(ordered[0].path() == "/t1");
  REQUIRE(ordered[1].port() == 2300);
  REQUIRE(ordered[2].path() == "/g1");
  REQUIRE(ordered[3].port() == 5901);
}

TEST_CASE("The first text console that works wins", "[ConsoleSelector]") {
  shared_ptr<FakeConsoleBackend> backend(new FakeConsoleBackend());
  ConsoleList consoles;
  addConsole(&consoles, GRAPHICAL, "/g1", 0);
  addConsole(&consoles, TEXT, "/t1", 0);
  addConsole(&consoles, TEXT, "", 2300);

  SECTION("No failures") {
    REQUIRE(ConsoleSelector(backend).attach(consoles) == 0);
    REQUIRE(backend->calls == vector<string>({"text /t1"}));
  }

  SECTION("Unix path fails, TCP port works") {
    backend->failing.insert("text /t1");
    REQUIRE(ConsoleSelector(backend).attach(consoles) == 0);
    REQUIRE(backend->calls ==
            vector<string>({"text /t1", "text 127.0.0.1:2300"}));
  }

  SECTION("Both text consoles fail, graphical is bridged") {
    backend->failing.insert("text /t1");
    backend->failing.insert("text 127.0.0.1:2300");
    REQUIRE(ConsoleSelector(backend).attach(consoles) == 0);
    REQUIRE(backend->calls ==
            vector<string>({"text /t1", "text 127.0.0.1:2300", "bridge /g1",
                            "viewer 6000", "stop bridge"}));
  }
}

TEST_CASE("Graphical consoles on a port skip the bridge",
          "[ConsoleSelector]") {
  shared_ptr<FakeConsoleBackend> backend(new FakeConsoleBackend());
  ConsoleList consoles;
  addConsole(&consoles, GRAPHICAL, "", 5901);
  REQUIRE(ConsoleSelector(backend).attach(consoles) == 0);
  REQUIRE(backend->calls == vector<string>({"viewer 5901"}));
}

TEST_CASE("A failing viewer tears the bridge down and moves on",
          "[ConsoleSelector]") {
  shared_ptr<FakeConsoleBackend> backend(new FakeConsoleBackend());
  backend->failing.insert("viewer 6000");
  ConsoleList consoles;
  addConsole(&consoles, GRAPHICAL, "/g1", 0);
  addConsole(&consoles, GRAPHICAL, "", 5901);
  REQUIRE(ConsoleSelector(backend).attach(consoles) == 0);
  REQUIRE(backend->calls == vector<string>({"bridge /g1", "viewer 6000",
                                            "stop bridge", "viewer 5901"}));
}

TEST_CASE("Consoles without an endpoint are skipped", "[ConsoleSelector]") {
  shared_ptr<FakeConsoleBackend> backend(new FakeConsoleBackend());
  ConsoleList consoles;
  addConsole(&consoles, TEXT, "", 0);
  addConsole(&consoles, TEXT, "/t2", 0);
  REQUIRE(ConsoleSelector(backend).attach(consoles) == 0);
  REQUIRE(backend->calls == vector<string>({"text /t2"}));
}

TEST_CASE("Fallback runs when nothing else works", "[ConsoleSelector]") {
  shared_ptr<FakeConsoleBackend> backend(new FakeConsoleBackend());
  backend->failing.insert("text /t1");
  ConsoleList consoles;
  consoles.add_domids(7);
  consoles.add_domids(9);
  addConsole(&consoles, TEXT, "/t1", 0);

  SECTION("Fallback present") {
    backend->fallbackPath = "/usr/lib/xen-4.2/bin/xenconsole";
    backend->fallbackStatus = 3;
    REQUIRE(ConsoleSelector(backend).attach(consoles) == 3);
    REQUIRE(backend->calls.back() ==
            "fallback /usr/lib/xen-4.2/bin/xenconsole 7");
  }

  SECTION("No fallback") {
    REQUIRE(ConsoleSelector(backend).attach(consoles) == 1);
    REQUIRE(backend->calls == vector<string>({"text /t1"}));
  }

  SECTION("Fallback present but no domain id") {
    backend->fallbackPath = "/usr/lib/xen-4.2/bin/xenconsole";
    consoles.clear_domids();
    REQUIRE(ConsoleSelector(backend).attach(consoles) == 1);
    REQUIRE(backend->calls == vector<string>({"text /t1"}));
  }
}

TEST_CASE("An empty console list goes straight to the fallback",
          "[ConsoleSelector]") {
  shared_ptr<FakeConsoleBackend> backend(new FakeConsoleBackend());
  backend->fallbackPath = "/opt/xenconsole";
  ConsoleList consoles;
  consoles.add_domids(12);
  REQUIRE(ConsoleSelector(backend).attach(consoles) == 0);
  REQUIRE(backend->calls == vector<string>({"fallback /opt/xenconsole 12"}));
}

TEST_CASE("A console that hangs up after a session is a normal exit",
          "[ConsoleSelector]") {
  shared_ptr<PipeTunnelBackend> backend(new PipeTunnelBackend());
  backend->fallbackPath = "/usr/bin/fallback";
  backend->fallbackStatus = 7;
  string directory = makeTestDirectory("vmconsole_selector");
  SocketEndpoint endpoint(directory + "/console.sock");
  shared_ptr<SocketHandler> consoleSocketHandler(new PipeSocketHandler());
  int listenFd = *(consoleSocketHandler->listen(endpoint).begin());

  std::thread consoleThread([&]() {
    int fd = acceptWithTimeout(consoleSocketHandler, listenFd);
    consoleSocketHandler->stopListening(endpoint);
    writeAllToSocket(consoleSocketHandler, fd, "login: ");
    consoleSocketHandler->close(fd);
  });

  ConsoleList consoles;
  consoles.add_domids(12);
  addConsole(&consoles, TEXT, endpoint.getName(), 0);
  addConsole(&consoles, TEXT, "", 2300);
  addConsole(&consoles, GRAPHICAL, "/g1", 0);
  int status = ConsoleSelector(backend).attach(consoles);
  consoleThread.join();

  REQUIRE(status == 0);
  REQUIRE(backend->calls == vector<string>({"text " + endpoint.getName()}));
  REQUIRE(readExactly(backend->stdoutPipe[0], 7) == "login: ");
  fs::remove_all(directory);
}
