#include "hpr/Logger.hpp"
#include <mutex>
#include <spdlog/spdlog.h>

namespace hpr
{

namespace
{
  std::mutex LoggerMutex;
  std::shared_ptr<spdlog::logger> Logger;
}

std::shared_ptr<spdlog::logger> logger()
{
  std::lock_guard<std::mutex> lock(LoggerMutex);
  if (!Logger)
  {
    Logger = spdlog::get(LoggerName);
    if (!Logger)
    {
      auto const & defaultSinks = spdlog::default_logger()->sinks();
      Logger = std::make_shared<spdlog::logger>(LoggerName, defaultSinks.begin(), defaultSinks.end());
      Logger->set_level(spdlog::default_logger()->level());
    }
  }
  return Logger;
}

void setLogger(std::shared_ptr<spdlog::logger> const & newLogger)
{
  std::lock_guard<std::mutex> lock(LoggerMutex);
  Logger = newLogger;
}

}
