#pragma once

#include <mutex>
#include <ostream>
#include <string>

namespace gymbridge {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

// -----------------------------------------------------------------------------
// Logger - tagged line logger shared by the server components
// -----------------------------------------------------------------------------
//
// @brief  Writes "[<name>] <LEVEL>: <message>" lines, filtered by a minimum
//         level. Debug/info lines go to the regular stream, warning/error
//         lines to the error stream.
//
// @details
// The server, the step hook, the episode runner and the data acquisition
// loop all log through the same Logger instance. It is handed to each of
// them explicitly at construction; nothing looks it up globally.
//
// Thread model:
//   A mutex serializes writes so the data server thread and the main thread
//   can share a process without interleaving partial lines.
//
// Ownership:
//   Holds non-owning references to the two output streams (std::cout and
//   std::cerr by default). The streams must outlive the logger.
// -----------------------------------------------------------------------------
class Logger {
 public:
  explicit Logger(std::string name, LogLevel level = LogLevel::Warning,
                  std::ostream* out = nullptr, std::ostream* err = nullptr);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void debug(const std::string& message);
  void info(const std::string& message);
  void warning(const std::string& message);
  void error(const std::string& message);

  bool enabled(LogLevel level) const { return level >= level_; }

  const std::string& name() const { return name_; }
  LogLevel level() const { return level_; }
  void setLevel(LogLevel level) { level_ = level; }

 private:
  void write(LogLevel level, const std::string& message);

  std::string name_;
  LogLevel level_;
  std::ostream* out_;
  std::ostream* err_;
  std::mutex mutex_;
};

// Parses "debug" | "info" | "warning" | "error" (case-sensitive).
// Throws std::invalid_argument on anything else.
LogLevel parseLogLevel(const std::string& text);

const char* logLevelToString(LogLevel level);

}  // namespace gymbridge
