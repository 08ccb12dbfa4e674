#include "ConsoleDescriptors.hpp"

namespace vc {
namespace {
ConsoleProtocol parseProtocol(const string& value) {
  string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
  if (lower == "vt100" || lower == "text") {
    return TEXT;
  }
  if (lower == "rfb" || lower == "graphical") {
    return GRAPHICAL;
  }
  throw DescriptorParseException("Unknown console protocol: " + value);
}

ConsoleDescriptor parseDescriptor(const json& entry) {
  if (!entry.is_object()) {
    throw DescriptorParseException("Console entry is not an object: " +
                                   entry.dump());
  }
  if (!entry.contains("protocol") || !entry["protocol"].is_string()) {
    throw DescriptorParseException("Console entry without a protocol: " +
                                   entry.dump());
  }
  ConsoleDescriptor descriptor;
  descriptor.set_protocol(parseProtocol(entry["protocol"].get<string>()));

  if (entry.contains("path") && !entry["path"].is_null()) {
    if (!entry["path"].is_string()) {
      throw DescriptorParseException("Console path must be a string: " +
                                     entry.dump());
    }
    descriptor.set_path(entry["path"].get<string>());
  }
  if (entry.contains("port") && !entry["port"].is_null()) {
    if (!entry["port"].is_number_integer()) {
      throw DescriptorParseException("Console port must be an integer: " +
                                     entry.dump());
    }
    int64_t port = entry["port"].get<int64_t>();
    if (port < 0 || port > 65535) {
      throw DescriptorParseException("Console port out of range: " +
                                     to_string(port));
    }
    descriptor.set_port(int(port));
  }
  return descriptor;
}
}  // namespace

ConsoleList parseConsoleList(const string& jsonText) {
  json document;
  try {
    document = json::parse(jsonText);
  } catch (const json::parse_error& pe) {
    throw DescriptorParseException(string("Invalid console list: ") +
                                   pe.what());
  }

  ConsoleList consoles;
  const json* entries = &document;
  if (document.is_object()) {
    if (document.contains("name") && document["name"].is_string()) {
      consoles.set_name(document["name"].get<string>());
    }
    if (document.contains("domids")) {
      if (!document["domids"].is_array()) {
        throw DescriptorParseException("domids must be an array");
      }
      for (const auto& domid : document["domids"]) {
        if (!domid.is_number_integer()) {
          throw DescriptorParseException("domid must be an integer: " +
                                         domid.dump());
        }
        consoles.add_domids(domid.get<int64_t>());
      }
    }
    if (!document.contains("consoles")) {
      return consoles;
    }
    entries = &document["consoles"];
  }
  if (!entries->is_array()) {
    throw DescriptorParseException("consoles must be an array");
  }
  for (const auto& entry : *entries) {
    *(consoles.add_consoles()) = parseDescriptor(entry);
  }
  VLOG(1) << "Parsed " << consoles.consoles_size() << " console(s)";
  return consoles;
}

ConsoleList loadConsoleList(const string& filename) {
  stringstream ss;
  if (filename == "-") {
    ss << cin.rdbuf();
  } else {
    ifstream input(filename);
    if (!input.good()) {
      throw DescriptorParseException("Cannot open console list " + filename);
    }
    ss << input.rdbuf();
  }
  return parseConsoleList(ss.str());
}

json consoleListToJson(const ConsoleList& consoles) {
  json document;
  document["name"] = consoles.name();
  document["domids"] = json::array();
  for (auto domid : consoles.domids()) {
    document["domids"].push_back(domid);
  }
  document["consoles"] = json::array();
  for (const auto& descriptor : consoles.consoles()) {
    json entry;
    entry["protocol"] = descriptor.protocol() == GRAPHICAL ? "rfb" : "vt100";
    entry["path"] = descriptor.path();
    entry["port"] = descriptor.port();
    document["consoles"].push_back(entry);
  }
  return document;
}

string protocolName(ConsoleProtocol protocol) {
  switch (protocol) {
    case TEXT:
      return "VT100";
    case GRAPHICAL:
      return "RFB";
  }
  return "UNKNOWN";
}

string describeConsole(const ConsoleDescriptor& descriptor) {
  stringstream ss;
  ss << protocolName(descriptor.protocol()) << " console";
  if (!descriptor.path().empty()) {
    ss << " at " << descriptor.path();
  } else if (descriptor.port() != 0) {
    ss << " on port " << descriptor.port();
  }
  return ss.str();
}

string formatConsoleTable(const ConsoleList& consoles) {
  char line[512];
  stringstream ss;
  snprintf(line, sizeof(line), "%-10s %-6s %s\n", "protocol", "port", "path");
  ss << line;
  for (const auto& descriptor : consoles.consoles()) {
    snprintf(line, sizeof(line), "%-10s %-6d %s\n",
             protocolName(descriptor.protocol()).c_str(), descriptor.port(),
             descriptor.path().c_str());
    ss << line;
  }
  return ss.str();
}
}  // namespace vc
