#ifndef _HPR_API_HTTP_READER_H
#define _HPR_API_HTTP_READER_H

#include <cstdint>
#include <memory>
#include <string>
#include "hpr/Common.hpp"
#include "hpr/Defs.hpp"
#include "hpr/IHttpTransport.hpp"
#include "hpr/IReader.hpp"

namespace hpr
{

// Reads a remote resource through HTTP byte-range requests. Fetched blocks
// are kept in memory for the lifetime of the reader and never requested again.
class HPR_API_DECL HttpReader: public IReader
{
public:
  // Probes the resource with HEAD. Throws ReaderError(ResourceNotFound) or
  // ReaderError(ProbeFailed).
  HttpReader(std::string const & url, std::shared_ptr<IHttpTransport> const & transport,
    ReaderOptions const & = ReaderOptions());
  ~HttpReader();

  HttpReader(HttpReader const &) = delete;
  void operator =(HttpReader const &) = delete;

  uint64_t size() const override;
  size_t read(uint64_t position, size_t size, void *) const override;

  std::string const & url() const;
  size_t blockSize() const;

  // Diagnostics
  size_t cachedBlocksCount() const;

private:
  struct Impl;
  Impl * m_impl;
};

HPR_API_DECL std::unique_ptr<IReader> OpenHttpReader(const char * url, ReaderOptions const & = ReaderOptions());

}

#endif
