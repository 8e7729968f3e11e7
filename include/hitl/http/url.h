#ifndef HITL_HTTP_URL_H
#define HITL_HTTP_URL_H

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace hitl {
namespace http {

using Params = std::vector<std::pair<std::string, std::string>>;

// Percent-encodes everything outside the RFC 3986 unreserved set
std::string urlEncode(const std::string& value);

// Decodes %XX escapes and '+' as space
std::string urlDecode(const std::string& value);

// application/x-www-form-urlencoded body, keeps parameter order
std::string formEncode(const Params& params);

// Parses "a=1&b=2"; later duplicates overwrite earlier ones
std::map<std::string, std::string> parseQuery(const std::string& query);

// Appends params to a URL that may already carry a query
std::string buildUrl(const std::string& base, const Params& params);

// Drops query and fragment so URLs can be logged without codes or tokens
std::string redactQuery(const std::string& url);

struct UrlParts {
  std::string scheme;
  std::string host;
  uint16_t port = 0;  // 0 when not given explicitly
  std::string path;
  std::string query;
};

// Returns false when the input is not an absolute http(s) URL
bool parseUrl(const std::string& url, UrlParts& parts);

// http://127.0.0.1, http://[::1] or http://localhost
bool isLoopbackUrl(const UrlParts& parts);

}  // namespace http
}  // namespace hitl

#endif  // HITL_HTTP_URL_H
