#ifndef __RV_LOG_HANDLER__
#define __RV_LOG_HANDLER__

#include "Headers.hpp"

namespace rv {
/**
 * @brief Owns the easylogging++ setup shared by the listener and the bridge.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging++ from `argc/argv`.
   * @return The default configuration, to be completed by setupLogFiles().
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file in `path`.
   *
   * The file is named `<prefix>-<timestamp>[_<pid>].log`.  When
   * `redirectStderrToFile` is set, stderr goes to a sibling
   * `<prefix>-stderr-...` file so nothing leaks onto the terminal.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Applies the verbose level and the silent switch to `defaultConf`.
   */
  static void setupVerbosity(el::Configurations *defaultConf, int verboseLevel,
                             bool silent);

  /**
   * @brief Deletes a rotated log file.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Configures the "stdout" logger used for user-facing messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace rv
#endif  // __RV_LOG_HANDLER__
