#ifndef __MX_LOG_HANDLER__
#define __MX_LOG_HANDLER__

#include "Headers.hpp"

namespace mx {
/**
 * @brief Configures easylogging++ for the client, its tools and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging with the process arguments and returns the
   * base configuration (format, flushing, verbose format).
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a new, uniquely named log file in
   * `directory` and enables size-capped rollover.
   * @return the full path of the log file.
   */
  static string setupLogFiles(el::Configurations *conf,
                              const string &directory, const string &prefix,
                              bool logToStdout = false,
                              const string &maxLogSize = "20971520");

  /**
   * @brief Called by easylogging before a log file rolls over; removes the
   * full file.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Makes the "stdout" logger print bare messages.  Used for output
   * meant for the user rather than for the log.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace mx
#endif  // __MX_LOG_HANDLER__
