#ifndef _HPR_API_LOGGER_H
#define _HPR_API_LOGGER_H

#include <memory>
#include "hpr/Defs.hpp"

namespace spdlog
{
class logger;
}

namespace hpr
{

const char LoggerName[] = "hpr";

// Logger used by the library. Created on first use from the spdlog default
// logger sinks unless a logger named "hpr" is already registered.
// Readers take the logger once on construction, setLogger affects readers created afterwards.
HPR_API_DECL std::shared_ptr<spdlog::logger> logger();
HPR_API_DECL void setLogger(std::shared_ptr<spdlog::logger> const &);

}

#endif
