#pragma once
#ifndef CHUNKVAULT_LOGGER_H
#define CHUNKVAULT_LOGGER_H
#include <fstream>
#include <mutex>
#include <string>

namespace chunkvault {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name such as "debug" or "WARN".
 * @throw std::invalid_argument if the name is not a known level.
 */
LogLevel logLevelFromString(const std::string &name);

/**
 * @brief Process-wide logger writing one timestamped line per record.
 *
 * Output goes either to a size-rotated file or, when initialised with
 * CONSOLE_ONLY_OUTPUT, to standard output. All methods are thread-safe.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT;

  /**
   * @brief (Re)initialise the singleton.
   * @param logFile Path of the log file or CONSOLE_ONLY_OUTPUT.
   * @param level Minimum level that is written.
   * @param maxFileSize Size in bytes after which the file is rotated.
   * @param maxBackupFiles Number of rotated files kept as logFile.1..N.
   */
  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;
  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  void rotateIfNeeded();
  static std::string getTimestamp();
  static std::string levelToString(LogLevel level);

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace chunkvault

#endif // CHUNKVAULT_LOGGER_H
