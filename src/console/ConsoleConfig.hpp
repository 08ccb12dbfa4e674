#ifndef __VC_CONSOLE_CONFIG_HPP__
#define __VC_CONSOLE_CONFIG_HPP__

#include "Headers.hpp"
#include "ReconnectingTunnel.hpp"

namespace vc {
class ConfigException : public std::runtime_error {
 public:
  explicit ConfigException(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Settings of the console tools, read from an INI file and then
 * overridden from the command line.
 */
struct ConsoleConfig {
  TunnelOptions tunnel;
  /** @brief Address the graphical bridge listens on. */
  string bridgeBindAddress = "127.0.0.1";
  /** @brief Viewer name (searched on PATH) or absolute path. */
  string viewerBinary = "vncviewer";
  /** @brief Host the viewer is told to connect to. */
  string viewerHost = "127.0.0.1";
  std::chrono::milliseconds viewerStartupDelay = std::chrono::milliseconds(0);
  /** @brief Out-of-process text consoles tried when nothing else works. */
  vector<string> fallbackPaths = {"/usr/lib/xen-4.1/bin/xenconsole",
                                  "/usr/lib/xen-4.2/bin/xenconsole"};
  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";
};

/**
 * @brief Returns the first default config file that exists
 * (<config home>/vmconsole/vmconsole.cfg, then /etc/vmconsole.cfg), or an
 * empty string.
 */
string findDefaultConfigFile();

/**
 * @brief Applies the INI file `filename` on top of `config`.
 * @throws ConfigException if the file cannot be read or holds invalid values.
 */
void loadConsoleConfig(const string& filename, ConsoleConfig* config);

/** @brief Same as loadConsoleConfig, for INI text held in memory. */
void parseConsoleConfig(const string& iniText, ConsoleConfig* config);
}  // namespace vc

#endif  // __VC_CONSOLE_CONFIG_HPP__
