#ifndef _HPR_API_LOGGING_READER_H
#define _HPR_API_LOGGING_READER_H

#include <memory>
#include "hpr/Defs.hpp"
#include "hpr/IReader.hpp"

namespace spdlog
{
class logger;
}

namespace hpr
{

// Forwards every call to the wrapped reader and logs it.
class HPR_API_DECL LoggingReader: public IReader
{
public:
  // Uses hpr::logger() when no logger is given
  explicit LoggingReader(std::shared_ptr<IReader> const & reader,
    std::shared_ptr<spdlog::logger> const & logger = std::shared_ptr<spdlog::logger>());

  uint64_t size() const override;
  size_t read(uint64_t position, size_t size, void *) const override;

  IReader & wrapped() const { return *m_reader; }

private:
  std::shared_ptr<IReader> const m_reader;
  std::shared_ptr<spdlog::logger> const m_logger;
};

}

#endif
