#include "SizeProbe.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <spdlog/spdlog.h>
#include "hpr/Logger.hpp"
#include "util/Assert.hpp"

namespace hpr
{

uint64_t ProbeResourceSize(IHttpTransport & transport, std::string const & url)
{
  HttpRequest request;
  request.method = HttpMethod::Head;
  request.url = url;

  HttpResponse response;
  try
  {
    response = transport.perform(request);
  }
  catch (ReaderError const & e)
  {
    ThrowReaderError(ErrorCode::ProbeFailed, std::string("HEAD request failed: ") + e.message());
  }

  if (response.status == 404 || response.status == 410)
    ThrowReaderError(ErrorCode::ResourceNotFound, "Resource not found: " + url);
  if (response.status < 200 || response.status >= 300)
    ThrowReaderError(ErrorCode::ProbeFailed,
      "HEAD " + url + " returned status " + std::to_string(response.status));

  std::string const * contentLength = response.header("Content-Length");
  if (!contentLength)
    ThrowReaderError(ErrorCode::ProbeFailed, "HEAD response has no Content-Length: " + url);
  std::string value = boost::algorithm::trim_copy(*contentLength);
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
    ThrowReaderError(ErrorCode::ProbeFailed, "Invalid Content-Length '" + value + "': " + url);

  uint64_t size;
  try
  {
    size = boost::lexical_cast<uint64_t>(value);
  }
  catch (boost::bad_lexical_cast const &)
  {
    ThrowReaderError(ErrorCode::ProbeFailed, "Invalid Content-Length '" + value + "': " + url);
  }

  logger()->info("Opened {} ({} bytes)", url, size);
  return size;
}

}
