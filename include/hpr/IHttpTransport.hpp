#ifndef _HPR_API_IHTTP_TRANSPORT_H
#define _HPR_API_IHTTP_TRANSPORT_H

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "hpr/Common.hpp"
#include "hpr/Defs.hpp"

namespace hpr
{

enum class HttpMethod
{
  Head,
  Get
};

typedef std::vector<std::pair<std::string, std::string>> HttpHeaders;

struct HttpRequest
{
  HttpMethod method;
  std::string url;
  HttpHeaders headers;
};

struct HPR_API_DECL HttpResponse
{
  long status = 0;
  HttpHeaders headers;
  std::string body;

  // Case-insensitive, first match. Empty pointer if header is absent.
  std::string const * header(const char * name) const;
};

// Made virtual mostly for mocking purposes
class IHttpTransport
{
public:
  // Blocks until the whole response is received.
  // Throws ReaderError(FetchFailed) on transport level failures.
  virtual HttpResponse perform(HttpRequest const &) = 0;

  virtual ~IHttpTransport() {}
};

HPR_API_DECL std::shared_ptr<IHttpTransport> CreateCurlTransport(ReaderOptions const & = ReaderOptions());

}

#endif
