#include "hpr/IHttpTransport.hpp"
#include <exception>
#include <memory>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include "hpr/Logger.hpp"
#include "util/Assert.hpp"
#include "CurlCallbacks.hpp"

namespace hpr
{

namespace
{

// curl_global_init isn't thread safe and has to precede any easy handle
class CurlGlobal
{
public:
  static void init()
  {
    static CurlGlobal instance;
    if (instance.m_code != CURLE_OK)
      ThrowReaderError(ErrorCode::FetchFailed,
        std::string("curl_global_init failed: ") + curl_easy_strerror(instance.m_code));
  }

private:
  CurlGlobal()
    : m_code(curl_global_init(CURL_GLOBAL_DEFAULT))
  {}

  ~CurlGlobal()
  {
    if (m_code == CURLE_OK)
      curl_global_cleanup();
  }

  CURLcode const m_code;
};

struct EasyHandleDeleter
{
  void operator()(CURL * curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter
{
  void operator()(curl_slist * list) const { curl_slist_free_all(list); }
};

void StoreHeaderLine(std::string const & line, HttpHeaders & headers)
{
  // Every response of a redirect chain starts with a status line
  if (boost::algorithm::starts_with(line, "HTTP/"))
  {
    headers.clear();
    return;
  }
  size_t colon = line.find(':');
  if (colon != std::string::npos && colon > 0)
    headers.emplace_back(
      boost::algorithm::trim_copy(line.substr(0, colon)),
      boost::algorithm::trim_copy(line.substr(colon + 1)));
}

}

size_t CurlWriteCallback(char * contents, size_t size, size_t nmemb, void * userp)
{
  try
  {
    std::string & body = *static_cast<std::string *>(userp);
    body.append(contents, size * nmemb);
    return size * nmemb;
  }
  catch (std::exception const & e)
  {
    logger()->error("Can't store response body: {}", e.what());
    return 0;
  }
}

size_t CurlHeaderCallback(char * contents, size_t size, size_t nmemb, void * userp)
{
  try
  {
    StoreHeaderLine(std::string(contents, size * nmemb), *static_cast<HttpHeaders *>(userp));
    return size * nmemb;
  }
  catch (std::exception const & e)
  {
    logger()->error("Can't store response header: {}", e.what());
    return 0;
  }
}

namespace
{

class CurlTransport: public IHttpTransport
{
public:
  explicit CurlTransport(ReaderOptions const & options)
    : m_options(options)
  {
    CurlGlobal::init();
  }

  HttpResponse perform(HttpRequest const & request) override
  {
    // Easy handle per request, so that transport is usable from many threads
    std::unique_ptr<CURL, EasyHandleDeleter> curl(curl_easy_init());
    if (!curl)
      ThrowReaderError(ErrorCode::FetchFailed, "curl_easy_init failed");

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    for (auto const & header : request.headers)
    {
      std::string line = header.first + ": " + header.second;
      curl_slist * appended = curl_slist_append(headers.get(), line.c_str());
      if (!appended)
        ThrowReaderError(ErrorCode::FetchFailed, "curl_slist_append failed");
      headers.release();
      headers.reset(appended);
    }

    HttpResponse response;
    char errorBuffer[CURL_ERROR_SIZE] = {};
    CURL * handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L); // Multithreading safety
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, m_options.userAgent.c_str());
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "identity");
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, m_options.followRedirects ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, m_options.connectTimeoutSeconds);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, m_options.requestTimeoutSeconds);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, CurlHeaderCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    if (request.method == HttpMethod::Head)
      curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    else
      curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);

    CURLcode code = curl_easy_perform(handle);
    if (code != CURLE_OK)
    {
      std::string description = errorBuffer[0] ? errorBuffer : curl_easy_strerror(code);
      logger()->warn("{} {} failed: {}", request.method == HttpMethod::Head ? "HEAD" : "GET",
        request.url, description);
      ThrowReaderError(ErrorCode::FetchFailed, request.url + ": " + description);
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
  }

private:
  ReaderOptions const m_options;
};

}

std::shared_ptr<IHttpTransport> CreateCurlTransport(ReaderOptions const & options)
{
  return std::make_shared<CurlTransport>(options);
}

}
