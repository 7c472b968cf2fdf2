#include "hpr/IHttpTransport.hpp"
#include <boost/algorithm/string/predicate.hpp>

namespace hpr
{

std::string const * HttpResponse::header(const char * name) const
{
  for (auto const & item : headers)
    if (boost::algorithm::iequals(item.first, name))
      return &item.second;
  return nullptr;
}

}
