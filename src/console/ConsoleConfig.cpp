#include "ConsoleConfig.hpp"

#include "SimpleIni.h"
#include "sago/platform_folders.h"

namespace vc {
namespace {
int64_t readInt(const CSimpleIniA& ini, const char* section, const char* key,
                int64_t defaultValue, int64_t minValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return defaultValue;
  }
  int64_t result;
  try {
    size_t pos = 0;
    result = stoll(string(value), &pos);
    if (trim(string(value).substr(pos)).length()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw ConfigException(string("Invalid value for ") + section + "." + key +
                          ": " + value);
  }
  if (result < minValue) {
    throw ConfigException(string("Value for ") + section + "." + key +
                          " must be at least " + to_string(minValue));
  }
  return result;
}

void applyConfig(const CSimpleIniA& ini, ConsoleConfig* config) {
  config->tunnel.initialDelay = std::chrono::milliseconds(
      readInt(ini, "Tunnel", "initial_delay_ms",
              config->tunnel.initialDelay.count(), 1));
  config->tunnel.retryCeiling = std::chrono::milliseconds(
      readInt(ini, "Tunnel", "retry_ceiling_ms",
              config->tunnel.retryCeiling.count(), 0));
  config->tunnel.blockSize =
      readInt(ini, "Tunnel", "block_size", config->tunnel.blockSize, 1);

  config->bridgeBindAddress =
      ini.GetValue("Bridge", "bind_address", config->bridgeBindAddress.c_str());

  config->viewerBinary =
      ini.GetValue("Viewer", "binary", config->viewerBinary.c_str());
  config->viewerHost = ini.GetValue("Viewer", "host", config->viewerHost.c_str());
  config->viewerStartupDelay = std::chrono::milliseconds(
      readInt(ini, "Viewer", "startup_delay_ms",
              config->viewerStartupDelay.count(), 0));

  const char* fallbackPaths = ini.GetValue("Fallback", "paths", NULL);
  if (fallbackPaths) {
    config->fallbackPaths.clear();
    for (const auto& path : split(string(fallbackPaths), ',')) {
      string trimmed = trim(path);
      if (!trimmed.empty()) {
        config->fallbackPaths.push_back(trimmed);
      }
    }
  }

  config->verbose = readInt(ini, "Debug", "verbose", config->verbose, 0);
  config->silent = readInt(ini, "Debug", "silent", config->silent, 0) != 0;
  int64_t logsize = readInt(ini, "Debug", "logsize", 0, 0);
  if (logsize != 0) {
    config->maxLogSize = to_string(logsize);
  }
}
}  // namespace

string findDefaultConfigFile() {
  vector<string> candidates;
  try {
    candidates.push_back(sago::getConfigHome() + "/vmconsole/vmconsole.cfg");
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "No user config home: " << re.what();
  }
  candidates.push_back("/etc/vmconsole.cfg");
  for (const auto& candidate : candidates) {
    if (fs::exists(candidate)) {
      return candidate;
    }
  }
  return "";
}

void loadConsoleConfig(const string& filename, ConsoleConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw ConfigException("Invalid config file: " + filename);
  }
  LOG(INFO) << "Loading config file " << filename;
  applyConfig(ini, config);
}

void parseConsoleConfig(const string& iniText, ConsoleConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(iniText);
  if (rc < 0) {
    throw ConfigException("Invalid config data");
  }
  applyConfig(ini, config);
}
}  // namespace vc
