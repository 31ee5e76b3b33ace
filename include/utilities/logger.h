#pragma once
#ifndef _COGDEDUP_LOGGER_H_
#define _COGDEDUP_LOGGER_H_
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace cogdedup {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/// Parse "debug", "INFO", ... ; throws std::invalid_argument.
LogLevel parseLogLevel(const std::string &name);

/**
 * @brief Process-wide JSON-lines logger with size-based rotation.
 *
 * Each line is an object with "timestamp", "level", "message" and, for
 * the component overload, "component". When the active file grows past
 * maxFileSize it is renamed to file.1, older backups shift up and at most
 * maxBackupFiles are kept.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  /// Pass as logFile to write to stdout only.
  static const std::string CONSOLE_ONLY_OUTPUT;

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /**
   * @brief Access the active logger.
   *
   * Falls back to a console-only logger at WARN when init() was never
   * called.
   * @throw std::runtime_error If even the fallback cannot be created.
   */
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;
  const std::string &logFile() const { return logFilePath; }

  void log(LogLevel level, const std::string &message);
  void log(LogLevel level, const std::string &component,
           const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  void write(LogLevel level, const std::string *component,
             const std::string &message);
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

} // namespace cogdedup

#endif
