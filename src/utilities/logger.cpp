#include "utilities/logger.h"
#include "utilities/json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <new>

namespace cogdedup {

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

LogLevel parseLogLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return LogLevel::TRACE;
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "INFO")
    return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "FATAL")
    return LogLevel::FATAL;
  throw std::invalid_argument("Unknown log level: " + name);
}

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    std::cerr << "[Logger::init] CRITICAL: allocation failed: " << bae.what()
              << std::endl;
  }
}

Logger &Logger::getInstance() {
  {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_instance) {
      return *s_instance;
    }
  }
  std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
               "Logger::init(); logging to console at WARN."
            << std::endl;
  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);

  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    throw std::runtime_error("Logger not initialized. Call Logger::init() "
                             "first. Emergency init also failed.");
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
}

LogLevel Logger::logLevel() const {
  std::lock_guard<std::mutex> lock(s_mutex);
  return currentLogLevel;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  write(level, nullptr, message);
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message) {
  write(level, &component, message);
}

void Logger::write(LogLevel level, const std::string *component,
                   const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }

  JsonValue obj(JsonValueType::Object);
  JsonValue ts(JsonValueType::String);
  ts.string_value = getTimestamp();
  JsonValue lvl(JsonValueType::String);
  lvl.string_value = levelToString(level);
  JsonValue comp(JsonValueType::String);
  JsonValue msg(JsonValueType::String);
  msg.string_value = message;
  obj.InsertIntoObject("timestamp", &ts);
  obj.InsertIntoObject("level", &lvl);
  if (component) {
    comp.string_value = *component;
    obj.InsertIntoObject("component", &comp);
  }
  obj.InsertIntoObject("message", &msg);
  const std::string jsonLine = obj.ToString();

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  }
}

// Caller holds s_mutex.
void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0) {
    return;
  }
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize) {
    return;
  }
  logFileStream.close();

  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string oldest = logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(oldest.c_str());
    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string from = logFilePath + "." + std::to_string(i);
      std::string to = logFilePath + "." + std::to_string(i + 1);
      std::ifstream backup(from.c_str());
      if (backup.good()) {
        backup.close();
        std::rename(from.c_str(), to.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }

  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}

} // namespace cogdedup
