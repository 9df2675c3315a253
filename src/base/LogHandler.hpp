#ifndef __OC_LOG_HANDLER__
#define __OC_LOG_HANDLER__

#include "Headers.hpp"

namespace oc {
/**
 * @brief Central easylogging++ setup shared by oclisten and the tests.
 *
 * Every binary logs through the default logger with one line format.  The
 * "stdout" logger is reserved for messages meant for a human at a terminal.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging++ and returns the base configuration.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file in @p directory.
   * @return The full path of the file that was created.
   */
  static string setupLogFile(el::Configurations *conf, const string &directory,
                             const string &filenamePrefix, bool logToStdout,
                             const string &maxLogSize = "20971520");

  /** @brief Applies the verbosity used by VLOG(). */
  static void setVerbosity(int level);

  /** @brief Deletes a rotated-out log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Reconfigures the "stdout" logger to print bare messages. */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace oc
#endif  // __OC_LOG_HANDLER__
