#ifndef __VC_LOG_HANDLER__
#define __VC_LOG_HANDLER__

#include "Headers.hpp"

namespace vc {
/**
 * @brief Configures easylogging++ for the console tools.
 *
 * Three loggers are used: "default" writes to a log file, while "stdout" and
 * "stderr" carry the bare messages meant for the operator.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a fresh file under `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false, bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /**
   * @brief Same as setupStdoutLogger, for one-line diagnostics on stderr.
   */
  static void setupStderrLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace vc
#endif  // __VC_LOG_HANDLER__
