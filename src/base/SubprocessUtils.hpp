#ifndef __VC_SUBPROCESS_UTILS__
#define __VC_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace vc {
/**
 * @brief Starts the external programs the console tools hand off to (the
 * graphical viewer and the fallback text console).  Virtual so tests can
 * record launches instead of running anything.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Resolves `name` to an executable path.
   *
   * Names containing a '/' are checked directly, other names are searched
   * for in each directory of PATH.
   * @return The path, or an empty string when nothing executable was found.
   */
  virtual string findExecutable(const string& name);

  /**
   * @brief Returns true if `path` exists and is executable by us.
   */
  virtual bool isExecutable(const string& path);

  /**
   * @brief Runs `command` with `args` (argv[0] is the command itself) without
   * a shell and waits for it to finish.
   * @return The exit status, 128 + signal number if it was killed, or 127 if
   * it could not be executed.
   */
  virtual int runAndWait(const string& command, const vector<string>& args);
};
}  // namespace vc

#endif  // __VC_SUBPROCESS_UTILS__
