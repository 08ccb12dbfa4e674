#ifndef __VC_CONSOLE_DESCRIPTORS_HPP__
#define __VC_CONSOLE_DESCRIPTORS_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace vc {
/**
 * @brief Thrown when resolver output cannot be turned into a ConsoleList.
 */
class DescriptorParseException : public std::runtime_error {
 public:
  explicit DescriptorParseException(const string& msg)
      : std::runtime_error(msg) {}
};

/**
 * @brief Parses resolver output.
 *
 * Accepts either an object with "name", "domids" and "consoles" or a bare
 * array of console objects.  Each console has a "protocol" ("vt100"/"text"
 * or "rfb"/"graphical") and an optional "path" and "port".
 */
ConsoleList parseConsoleList(const string& jsonText);

/** @brief Reads and parses a resolver file, or stdin when `filename` is "-". */
ConsoleList loadConsoleList(const string& filename);

json consoleListToJson(const ConsoleList& consoles);

/** @brief Protocol label as the console table shows it (VT100 / RFB). */
string protocolName(ConsoleProtocol protocol);

/** @brief A descriptor is usable when it has a path or a nonzero port. */
inline bool hasUsableEndpoint(const ConsoleDescriptor& descriptor) {
  return !descriptor.path().empty() || descriptor.port() != 0;
}

string describeConsole(const ConsoleDescriptor& descriptor);

/** @brief Renders the protocol/path/port table printed by `list`. */
string formatConsoleTable(const ConsoleList& consoles);
}  // namespace vc

#endif  // __VC_CONSOLE_DESCRIPTORS_HPP__
