#ifndef _HPR_API_IREADER_H
#define _HPR_API_IREADER_H

#include <cstdint>
#include "hpr/Common.hpp"

namespace hpr
{

// Random access to a read-only resource. Implementations are safe for
// concurrent read() calls.
class IReader
{
public:
  virtual uint64_t size() const = 0;
  // Returns number of bytes copied: less than 'size' only at end of resource.
  // Throws ReaderError on failure, never returns a short read instead.
  virtual size_t read(uint64_t position, size_t size, void *) const = 0;

  virtual ~IReader() {}
};

}

#endif
