#include "cpp_dataobject/src/utils/Logger.hpp"

#include <vector>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"
#include "cpp_dataobject/src/utils/ConfigurationSettings.hpp"

namespace cpp_dataobject
{
Logger::Logger() : logger_{nullptr}
{
  // Console only; a sink cannot fail to open here
  configure();
}

void Logger::configure(const std::string& loggerName,
                       const std::string& logFile,
                       spdlog::level::level_enum level)
{
  if (loggerName.empty())
  {
    throw std::invalid_argument("Logger name cannot be empty");
  }

  try
  {
    // Unregister existing logger if it exists
    if (logger_)
    {
      spdlog::drop(logger_->name());
      logger_.reset();
    }
    // A logger registered elsewhere under the same name would collide
    spdlog::drop(loggerName);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks = {console_sink};

    if (!logFile.empty())
    {
      auto file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
      file_sink->set_level(level);
      file_sink->set_pattern(
        "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [thread %t] %v");
      sinks.push_back(file_sink);
    }

    logger_ =
      std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());

    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger_);
  }
  catch (const spdlog::spdlog_ex& ex)
  {
    logger_.reset();
    throw std::runtime_error("Logger configuration failed: " +
                             std::string(ex.what()));
  }
}

void Logger::configureFromSettings(ConfigurationSettings& settings)
{
  std::string name = "cpp_dataobject";
  std::string file;
  auto level = spdlog::level::info;

  if (auto section = settings.getSection("logging"))
  {
    if (auto it = section->find("name"); it != section->end())
    {
      name = it->second;
    }
    if (auto it = section->find("file"); it != section->end())
    {
      file = it->second;
    }
    if (auto it = section->find("level"); it != section->end())
    {
      // spdlog maps unknown names to "off"
      level = spdlog::level::from_str(it->second);
      if (level == spdlog::level::off && it->second != "off")
      {
        throw ConfigurationError("Unknown log level: " + it->second);
      }
    }
  }

  configure(name, file, level);
}

void Logger::setLevel(spdlog::level::level_enum level)
{
  if (logger_)
  {
    logger_->set_level(level);
    for (auto& sink : logger_->sinks())
    {
      sink->set_level(level);
    }
  }
}

bool Logger::isConfigured() const
{
  return logger_ != nullptr;
}

std::shared_ptr<spdlog::logger> Logger::getLogger() const
{
  if (!logger_)
  {
    throw std::runtime_error("Logger not configured");
  }
  return logger_;
}
}  // namespace cpp_dataobject
