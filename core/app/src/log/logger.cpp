#include "gymbridge/log/logger.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace gymbridge {

// -----------------------------------------------------------------------------
// Constructor: default to std::cout / std::cerr
// -----------------------------------------------------------------------------
Logger::Logger(std::string name, LogLevel level, std::ostream* out,
               std::ostream* err)
    : name_(std::move(name)),
      level_(level),
      out_(out != nullptr ? out : &std::cout),
      err_(err != nullptr ? err : &std::cerr) {}

void Logger::debug(const std::string& message) {
  write(LogLevel::Debug, message);
}

void Logger::info(const std::string& message) {
  write(LogLevel::Info, message);
}

void Logger::warning(const std::string& message) {
  write(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) {
  write(LogLevel::Error, message);
}

// -----------------------------------------------------------------------------
// write(): level filter, then one locked line per message
// -----------------------------------------------------------------------------
void Logger::write(LogLevel level, const std::string& message) {
  if (!enabled(level)) {
    return;
  }

  std::ostream& stream = (level >= LogLevel::Warning) ? *err_ : *out_;

  std::lock_guard lock(mutex_);
  stream << "[" << name_ << "] " << logLevelToString(level) << ": " << message
         << "\n";
  stream.flush();
}

// -----------------------------------------------------------------------------
// parseLogLevel()
// -----------------------------------------------------------------------------
LogLevel parseLogLevel(const std::string& text) {
  if (text == "debug") return LogLevel::Debug;
  if (text == "info") return LogLevel::Info;
  if (text == "warning") return LogLevel::Warning;
  if (text == "error") return LogLevel::Error;
  throw std::invalid_argument("Unknown log level: " + text);
}

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
  }
  return "UNKNOWN";
}

}  // namespace gymbridge
