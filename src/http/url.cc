#include "hitl/http/url.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace hitl {
namespace http {

std::string urlEncode(const std::string& value) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    return value;
  }

  std::string result;
  char* encoded =
      curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
  if (encoded) {
    result = encoded;
    curl_free(encoded);
  }
  curl_easy_cleanup(curl);
  return result;
}

std::string urlDecode(const std::string& value) {
  std::string plus_decoded = value;
  std::replace(plus_decoded.begin(), plus_decoded.end(), '+', ' ');

  CURL* curl = curl_easy_init();
  if (!curl) {
    return plus_decoded;
  }

  std::string result;
  int length = 0;
  char* decoded = curl_easy_unescape(curl, plus_decoded.c_str(),
                                     static_cast<int>(plus_decoded.length()),
                                     &length);
  if (decoded) {
    result.assign(decoded, static_cast<size_t>(length));
    curl_free(decoded);
  }
  curl_easy_cleanup(curl);
  return result;
}

std::string formEncode(const Params& params) {
  std::string body;
  for (const auto& param : params) {
    if (!body.empty()) {
      body += '&';
    }
    body += urlEncode(param.first);
    body += '=';
    body += urlEncode(param.second);
  }
  return body;
}

std::map<std::string, std::string> parseQuery(const std::string& query) {
  std::map<std::string, std::string> result;
  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      if (eq == std::string::npos) {
        result[urlDecode(pair)] = "";
      } else {
        result[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
      }
    }
    start = end + 1;
  }
  return result;
}

std::string buildUrl(const std::string& base, const Params& params) {
  if (params.empty()) {
    return base;
  }
  char separator = base.find('?') == std::string::npos ? '?' : '&';
  return base + separator + formEncode(params);
}

std::string redactQuery(const std::string& url) {
  size_t cut = url.find_first_of("?#");
  return cut == std::string::npos ? url : url.substr(0, cut);
}

bool parseUrl(const std::string& url, UrlParts& parts) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return false;
  }
  parts = UrlParts();
  parts.scheme = url.substr(0, scheme_end);
  std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (parts.scheme != "http" && parts.scheme != "https") {
    return false;
  }

  size_t authority_start = scheme_end + 3;
  size_t path_start = url.find_first_of("/?#", authority_start);
  std::string authority = url.substr(
      authority_start, path_start == std::string::npos
                           ? std::string::npos
                           : path_start - authority_start);
  if (authority.empty()) {
    return false;
  }

  std::string port_text;
  if (authority[0] == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos) {
      return false;
    }
    parts.host = authority.substr(0, close + 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        return false;
      }
      port_text = authority.substr(close + 2);
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
      parts.host = authority;
    } else {
      parts.host = authority.substr(0, colon);
      port_text = authority.substr(colon + 1);
    }
  }
  std::transform(parts.host.begin(), parts.host.end(), parts.host.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (!port_text.empty()) {
    if (port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      return false;
    }
    long port = std::strtol(port_text.c_str(), nullptr, 10);
    if (port <= 0 || port > 65535) {
      return false;
    }
    parts.port = static_cast<uint16_t>(port);
  }

  if (path_start != std::string::npos) {
    std::string rest = url.substr(path_start);
    size_t fragment = rest.find('#');
    if (fragment != std::string::npos) {
      rest = rest.substr(0, fragment);
    }
    size_t query = rest.find('?');
    if (query != std::string::npos) {
      parts.query = rest.substr(query + 1);
      rest = rest.substr(0, query);
    }
    parts.path = rest;
  }
  if (parts.path.empty()) {
    parts.path = "/";
  }
  return true;
}

bool isLoopbackUrl(const UrlParts& parts) {
  return parts.scheme == "http" &&
         (parts.host == "127.0.0.1" || parts.host == "[::1]" ||
          parts.host == "localhost");
}

}  // namespace http
}  // namespace hitl
