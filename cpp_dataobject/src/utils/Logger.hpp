#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cpp_dataobject
{

class ConfigurationSettings;

/*!
 * \brief Process-wide owner of the named spdlog logger
 *
 * Components do not call getInstance() themselves; they are handed the
 * logger pointer returned by getLogger() and log through LOG_SAFE.
 */
class Logger
{
public:
  // Delete copy constructor and assignment operator
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Delete move constructor and assignment operator
  Logger(Logger&& logger) = delete;
  Logger& operator=(Logger&& rhs) = delete;

  // Get the singleton instance
  static Logger& getInstance()
  {
    static Logger instance;
    return instance;
  }

  /*!
   * \brief Rebuild the logger with console output and, when \p logFile
   *        is not empty, file output
   * \throws std::invalid_argument for an empty logger name
   * \throws std::runtime_error if spdlog cannot create a sink
   */
  void configure(const std::string& loggerName = "cpp_dataobject",
                 const std::string& logFile = "",
                 spdlog::level::level_enum level = spdlog::level::info);

  /*!
   * \brief Configure from the [logging] section of an .ini file
   *
   * Recognised keys are name, file and level. Missing keys keep the
   * defaults of configure(). A missing section configures the defaults.
   *
   * \throws ConfigurationError for an unknown level name
   */
  void configureFromSettings(ConfigurationSettings& settings);

  // Set log level
  void setLevel(spdlog::level::level_enum level);

  // Check if logger is configured
  bool isConfigured() const;

  // Get reference to the logger
  std::shared_ptr<spdlog::logger> getLogger() const;

private:
  Logger();
  ~Logger() = default;

  std::shared_ptr<spdlog::logger> logger_;
};


}  // namespace cpp_dataobject

// Macro for safe logging with logger pointer, level, and variadic arguments
// Usage: LOG_SAFE(pLogger, spdlog::level::info, "Message with {} args", value)
#define LOG_SAFE(logger_ptr, level, ...)                          \
  if ((logger_ptr) != nullptr && (logger_ptr)->should_log(level)) \
  (logger_ptr)->log(level, __VA_ARGS__)

#endif  // LOGGER_HPP
