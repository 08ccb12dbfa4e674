#include "ConsoleConfig.hpp"

#include "TestHeaders.hpp"

using namespace vc;

TEST_CASE("Defaults", "[ConsoleConfig]") {
  ConsoleConfig config;
  REQUIRE(config.tunnel.initialDelay.count() == 100);
  REQUIRE(config.tunnel.retryCeiling.count() == 5000);
  REQUIRE(config.tunnel.blockSize == 65536);
  REQUIRE(config.bridgeBindAddress == "127.0.0.1");
  REQUIRE(config.viewerBinary == "vncviewer");
  REQUIRE(config.viewerHost == config.bridgeBindAddress);
  REQUIRE(config.fallbackPaths.size() == 2);
}

TEST_CASE("INI values override the defaults", "[ConsoleConfig]") {
  ConsoleConfig config;
  parseConsoleConfig(
      "[Tunnel]\n"
      "initial_delay_ms = 50\n"
      "retry_ceiling_ms = 1000\n"
      "block_size = 4096\n"
      "[Bridge]\n"
      "bind_address = 0.0.0.0\n"
      "[Viewer]\n"
      "binary = /usr/bin/xtightvncviewer\n"
      "host = ::1\n"
      "startup_delay_ms = 250\n"
      "[Fallback]\n"
      "paths = /opt/xen/bin/xenconsole , /usr/sbin/xenconsole,\n"
      "[Debug]\n"
      "verbose = 3\n"
      "silent = 1\n"
      "logsize = 1024\n",
      &config);
  REQUIRE(config.tunnel.initialDelay.count() == 50);
  REQUIRE(config.tunnel.retryCeiling.count() == 1000);
  REQUIRE(config.tunnel.blockSize == 4096);
  REQUIRE(config.bridgeBindAddress == "0.0.0.0");
  REQUIRE(config.viewerBinary == "/usr/bin/xtightvncviewer");
  REQUIRE(config.viewerHost == "::1");
  REQUIRE(config.viewerStartupDelay.count() == 250);
  REQUIRE(config.fallbackPaths ==
          vector<string>({"/opt/xen/bin/xenconsole", "/usr/sbin/xenconsole"}));
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.maxLogSize == "1024");
}

TEST_CASE("Missing keys keep their values", "[ConsoleConfig]") {
  ConsoleConfig config;
  config.viewerBinary = "gvncviewer";
  parseConsoleConfig("[Tunnel]\nretry_ceiling_ms = 0\n", &config);
  REQUIRE(config.tunnel.retryCeiling.count() == 0);
  REQUIRE(config.tunnel.initialDelay.count() == 100);
  REQUIRE(config.viewerBinary == "gvncviewer");
}

TEST_CASE("Invalid values are rejected", "[ConsoleConfig]") {
  ConsoleConfig config;
  REQUIRE_THROWS_AS(
      parseConsoleConfig("[Tunnel]\ninitial_delay_ms = 0\n", &config),
      ConfigException);
  REQUIRE_THROWS_AS(
      parseConsoleConfig("[Tunnel]\nretry_ceiling_ms = soon\n", &config),
      ConfigException);
  REQUIRE_THROWS_AS(parseConsoleConfig("[Tunnel]\nblock_size = 12kb\n", &config),
                    ConfigException);
  REQUIRE_THROWS_AS(
      parseConsoleConfig("[Viewer]\nstartup_delay_ms = -5\n", &config),
      ConfigException);
}

TEST_CASE("Config files are loaded from disk", "[ConsoleConfig]") {
  string directory = makeTestDirectory("vmconsole_config");
  string path = directory + "/vmconsole.cfg";
  {
    ofstream out(path);
    out << "[Viewer]\nbinary = remote-viewer\n";
  }
  ConsoleConfig config;
  loadConsoleConfig(path, &config);
  REQUIRE(config.viewerBinary == "remote-viewer");
  REQUIRE_THROWS_AS(loadConsoleConfig(directory + "/missing.cfg", &config),
                    ConfigException);
  fs::remove_all(directory);
}
