#ifndef __SCANLINK_LOG_HANDLER__
#define __SCANLINK_LOG_HANDLER__

#include "Headers.hpp"

namespace scanlink {
/**
 * @brief Configures easylogging++ for the scanlink client and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a timestamped file under `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param maxlogsize Size in bytes after which the file is rolled over.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Removes a rolled-over log file.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Configures the "stdout" logger used for operator-facing lines.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace scanlink
#endif  // __SCANLINK_LOG_HANDLER__
