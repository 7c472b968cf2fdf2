#include "hpr/LoggingReader.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "hpr/Logger.hpp"
#include "hpr/ReaderError.hpp"

namespace hpr
{

LoggingReader::LoggingReader(std::shared_ptr<IReader> const & reader, std::shared_ptr<spdlog::logger> const & logger)
  : m_reader(reader)
  , m_logger(logger ? logger : hpr::logger())
{
  if (!m_reader)
    throw std::invalid_argument("LoggingReader requires a reader");
}

uint64_t LoggingReader::size() const
{
  return m_reader->size();
}

size_t LoggingReader::read(uint64_t position, size_t size, void * buffer) const
{
  m_logger->debug("read position={} size={}", position, size);
  try
  {
    size_t result = m_reader->read(position, size, buffer);
    m_logger->debug("read position={} size={} -> {}", position, size, result);
    return result;
  }
  catch (ReaderError const & e)
  {
    m_logger->debug("read position={} size={} failed: {} ({})", position, size, e.message(), ErrorCodeName(e.code()));
    throw;
  }
  catch (std::exception const & e)
  {
    m_logger->debug("read position={} size={} failed: {}", position, size, e.what());
    throw;
  }
}

}
