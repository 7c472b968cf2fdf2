#pragma once

#include <cstddef>

namespace hpr
{

// libcurl write and header callbacks. userp is std::string for the body and HttpHeaders for headers.
// Return 0 instead of throwing, so that curl aborts the transfer with CURLE_WRITE_ERROR.
size_t CurlWriteCallback(char * contents, size_t size, size_t nmemb, void * userp);
size_t CurlHeaderCallback(char * contents, size_t size, size_t nmemb, void * userp);

}
