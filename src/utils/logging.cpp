#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace streamscribe {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::initialize(LogLevel level) {
  setLevel(level);
  if (!initialized_) {
    initialized_ = true;
    debug("Logger initialized at level " + levelToString(level));
  }
}

void Logger::info(const std::string &message) {
  write(LogLevel::INFO, message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, message);
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::getLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool Logger::isEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  return level != LogLevel::OFF && level >= level_;
}

bool Logger::levelFromString(const std::string &name, LogLevel &level) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "DEBUG") {
    level = LogLevel::DEBUG;
  } else if (upper == "INFO") {
    level = LogLevel::INFO;
  } else if (upper == "WARN" || upper == "WARNING") {
    level = LogLevel::WARN;
  } else if (upper == "ERROR") {
    level = LogLevel::ERROR;
  } else if (upper == "OFF" || upper == "NONE") {
    level = LogLevel::OFF;
  } else {
    return false;
  }
  return true;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG: return "DEBUG";
  case LogLevel::INFO: return "INFO";
  case LogLevel::WARN: return "WARN";
  case LogLevel::ERROR: return "ERROR";
  case LogLevel::OFF: return "OFF";
  }
  return "UNKNOWN";
}

void Logger::write(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < level_ || level_ == LogLevel::OFF) {
    return;
  }

  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) % 1000;
  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream line;
  line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << millis.count() << " [" << levelToString(level)
       << "] " << message;

  // Warnings and errors go to stderr so stdout stays usable for transcripts.
  std::ostream &out =
      (level >= LogLevel::WARN) ? std::cerr : std::cout;
  out << line.str() << std::endl;
}

} // namespace utils
} // namespace streamscribe
