#include "ConsoleBackend.hpp"

#include "PipeSocketHandler.hpp"
#include "TcpSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace vc;

namespace {
struct BackendFixture {
  string directory;
  ConsoleConfig config;

  BackendFixture() { directory = makeTestDirectory("vmconsole_backend"); }
  ~BackendFixture() { fs::remove_all(directory); }

  shared_ptr<LocalConsoleBackend> backend() {
    return shared_ptr<LocalConsoleBackend>(new LocalConsoleBackend(
        shared_ptr<SocketHandler>(new PipeSocketHandler()),
        shared_ptr<SocketHandler>(new TcpSocketHandler()),
        shared_ptr<SubprocessUtils>(new SubprocessUtils()), config));
  }

  string readFile(const string& name) {
    ifstream in(directory + "/" + name);
    string line;
    getline(in, line);
    return line;
  }
};
}  // namespace

TEST_CASE("Viewer is started against the bridged port", "[ConsoleBackend]") {
  BackendFixture f;
  f.config.viewerBinary = writeTestScript(
      f.directory, "vncviewer", "echo \"$@\" > " + f.directory + "/viewer");
  f.backend()->launchViewer(5907);
  REQUIRE(f.readFile("viewer") == "127.0.0.1:5907");
}

TEST_CASE("Viewer failures", "[ConsoleBackend]") {
  BackendFixture f;

  SECTION("Missing viewer") {
    f.config.viewerBinary = f.directory + "/no-viewer";
    REQUIRE_THROWS_AS(f.backend()->launchViewer(5900), ViewerException);
  }

  SECTION("Viewer that exits with an error still counts as a session") {
    f.config.viewerBinary =
        writeTestScript(f.directory, "vncviewer", "exit 2");
    REQUIRE_NOTHROW(f.backend()->launchViewer(5900));
  }
}

TEST_CASE("Fallback console is the first executable candidate",
          "[ConsoleBackend]") {
  BackendFixture f;
  string fallback = writeTestScript(
      f.directory, "xenconsole",
      "echo \"$@\" > " + f.directory + "/fallback\nexit 5");
  f.config.fallbackPaths = {f.directory + "/xen-4.1/xenconsole", fallback};

  auto backend = f.backend();
  REQUIRE(backend->findFallbackConsole() == fallback);
  REQUIRE(backend->runFallbackConsole(fallback, 42) == 5);
  REQUIRE(f.readFile("fallback") == "42");
}

TEST_CASE("No fallback console", "[ConsoleBackend]") {
  BackendFixture f;
  f.config.fallbackPaths = {f.directory + "/missing"};
  REQUIRE(f.backend()->findFallbackConsole().empty());
}

TEST_CASE("Bridging an unreachable console fails", "[ConsoleBackend]") {
  BackendFixture f;
  REQUIRE_THROWS_AS(f.backend()->startBridge(f.directory + "/missing.sock"),
                    ConsoleConnectException);
}
