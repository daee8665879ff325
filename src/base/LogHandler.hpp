#ifndef __SB_LOG_HANDLER__
#define __SB_LOG_HANDLER__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Owns the easylogging++ setup shared by the server and the tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the base configuration.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points every level at a fresh file under `path`.
   * @param maxlogsize Size in bytes after which the file is rolled out.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix, bool logToStdout,
                            bool redirectStderrToFile,
                            const string &maxlogsize = "20971520");

  /** @brief Deletes the rolled out file; the log is closed at this point. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Message-only logger named "stdout" for console output. */
  static void setupStdoutLogger();

  /** @brief Directory used when no explicit log directory is given. */
  static string defaultLogDirectory();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace sb
#endif  // __SB_LOG_HANDLER__
