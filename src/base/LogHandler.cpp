#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace sb {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts / the config file, not from easylogging's
  // own argument parsing.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &path, const string &filenamePrefix,
                               bool logToStdout, bool redirectStderrToFile,
                               const string &maxlogsize) {
  char stamp[64];
  time_t rawtime = time(NULL);
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", localtime(&rawtime));
  string suffix = string(stamp) + "_" + std::to_string(getpid()) + ".log";
  string fullFname = createLogFile(path, filenamePrefix + "-" + suffix);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(path, filenamePrefix + "-stderr-" + suffix);
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // No logging in here, the log file is closed while this runs
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::defaultLogDirectory() {
  return GetTempDirectory() + "shellbridge";
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  string fullFname = path + "/" + filename;
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create logfile directory: " << fse.what()
                          << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string fullFname = createLogFile(path, stderrFilename);
  FILE *stderr_stream = freopen(fullFname.c_str(), "w", stderr);
  if (!stderr_stream) {
    STFATAL << "Invalid filename " << stderrFilename;
  }
  setvbuf(stderr_stream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace sb
