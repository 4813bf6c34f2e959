#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace faceverify {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

// Maps the Log.level config value. Unknown names fall back to INFO.
inline LogLevel parseLogLevel(std::string name) {
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (name == "debug")
    return LogLevel::DEBUG;
  if (name == "warn" || name == "warning")
    return LogLevel::WARN;
  if (name == "error")
    return LogLevel::ERROR;
  return LogLevel::INFO;
}

class Logger {
public:
  static void setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
  }

  static void setLogFile(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
      log_file_.close();
    }
    if (path.empty())
      return;
    log_file_.open(path, std::ios::app);
    if (!log_file_.is_open()) {
      std::cerr << "[Logger] Failed to open log file: " << path << std::endl;
    }
  }

  static void log(LogLevel level, const std::string &msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < current_level_) {
      return;
    }

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&in_time_t, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");

    const char *levelStr = "[INFO ]";
    switch (level) {
    case LogLevel::DEBUG:
      levelStr = "[DEBUG]";
      break;
    case LogLevel::INFO:
      levelStr = "[INFO ]";
      break;
    case LogLevel::WARN:
      levelStr = "[WARN ]";
      break;
    case LogLevel::ERROR:
      levelStr = "[ERROR]";
      break;
    }

    std::string fullMsg = ss.str() + " " + levelStr + " " + msg;

    if (level >= LogLevel::ERROR) {
      std::cerr << fullMsg << std::endl;
    } else {
      std::cout << fullMsg << std::endl;
    }

    if (log_file_.is_open()) {
      log_file_ << fullMsg << std::endl;
    }
  }

private:
  static inline std::mutex mutex_;
  static inline LogLevel current_level_ = LogLevel::INFO;
  static inline std::ofstream log_file_;
};

} // namespace faceverify
