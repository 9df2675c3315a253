#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace oc {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // %thread prints the name given by el::Helpers::setThreadName
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return conf;
}

string LogHandler::setupLogFile(el::Configurations *conf,
                                const string &directory,
                                const string &filenamePrefix, bool logToStdout,
                                const string &maxLogSize) {
  char timestamp[80];
  time_t now = time(NULL);
  strftime(timestamp, sizeof(timestamp), "%Y-%m-%d_%H-%M-%S", localtime(&now));
  string filename = filenamePrefix + "-" + timestamp + "_" +
                    std::to_string(getpid()) + ".log";
  string fullPath = createLogFile(directory, filename);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::Filename, fullPath);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    logToStdout ? "true" : "false");
  return fullPath;
}

void LogHandler::setVerbosity(int level) {
  if (level < 0) {
    level = 0;
  }
  if (level > 9) {
    level = 9;
  }
  el::Loggers::setVerboseLevel(level);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed at this point, so no logging here.
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

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << directory
                          << ": " << fse.what() << endl;
    exit(1);
  }
  string fullPath = (fs::path(directory) / filename).string();
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullPath;
}
}  // namespace oc
