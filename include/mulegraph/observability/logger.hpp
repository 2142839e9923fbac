#ifndef MULEGRAPH_OBSERVABILITY_LOGGER_HPP_
#define MULEGRAPH_OBSERVABILITY_LOGGER_HPP_

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

namespace mulegraph {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe; every entry carries timestamp, level, thread and component.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::cerr)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "");
  void info(const std::string& message, const std::string& component = "");
  void warn(const std::string& message, const std::string& component = "");
  void error(const std::string& message, const std::string& component = "");
  void fatal(const std::string& message, const std::string& component = "");

  // Structured logging with key-value pairs, emitted when the builder goes out of scope
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "");
    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, std::int64_t value);
    LogBuilder& field(const std::string& key, std::uint64_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    nlohmann::ordered_json fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const nlohmann::ordered_json& fields = nlohmann::ordered_json::object());

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) mulegraph::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) mulegraph::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) mulegraph::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) mulegraph::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) mulegraph::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  mulegraph::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace mulegraph

#endif  // MULEGRAPH_OBSERVABILITY_LOGGER_HPP_
