#pragma once

#include <cstdint>
#include <string>
#include "hpr/IHttpTransport.hpp"

namespace hpr
{

// Sends HEAD and returns Content-Length of the resource.
// Throws ReaderError(ResourceNotFound) or ReaderError(ProbeFailed).
uint64_t ProbeResourceSize(IHttpTransport &, std::string const & url);

}
