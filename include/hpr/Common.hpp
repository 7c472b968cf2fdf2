#ifndef _HPR_API_COMMON_H
#define _HPR_API_COMMON_H

#include <stddef.h>
#include <cstdint>
#include <string>

namespace hpr
{

typedef uint64_t BlockIndex;

const size_t DefaultBlockSize = 128 * 1024;

struct ReaderOptions
{
  size_t blockSize = DefaultBlockSize;

  // Used by the curl transport only
  long connectTimeoutSeconds = 10;
  long requestTimeoutSeconds = 0; // 0 - no limit
  bool followRedirects = true;
  std::string userAgent = "hpr/1.0";
};

}

#endif
