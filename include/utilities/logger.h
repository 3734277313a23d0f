#pragma once
#ifndef VIDSEAL_LOGGER_H
#define VIDSEAL_LOGGER_H
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide structured logger.
 *
 * Every entry is written as one JSON object per line with the keys
 * "timestamp", "level" and "message". File output is rotated by size,
 * keeping up to @c maxBackupFiles numbered backups.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; ///< Log to stdout only

  /**
   * @brief (Re)initialize the singleton.
   * @param logFile Path of the log file or CONSOLE_ONLY_OUTPUT.
   * @param level Minimum level that is written.
   * @param maxFileSize Rotation threshold in bytes (0 disables rotation).
   * @param maxBackupFiles Number of rotated files kept.
   */
  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  ~Logger();

  void setLogLevel(LogLevel level);
  void log(LogLevel level, const std::string &message);

  /**
   * @brief printf-style convenience wrapper around log().
   *
   * Messages longer than 1 KiB are truncated.
   */
  static void logf(LogLevel level, const char *format, ...);

  static std::string levelToString(LogLevel level);

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSize,
         int maxBackupFiles);

  std::string formatLine(LogLevel level, const std::string &message) const;
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::recursive_mutex s_mutex;
};

#endif // VIDSEAL_LOGGER_H
