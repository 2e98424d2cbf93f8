#include "UrlBuilder.hpp"
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace danfetch {

UrlBuilder::UrlBuilder(std::optional<std::string> credential,
                       std::string scheme, std::string host)
    : m_credential(std::move(credential)), m_scheme(std::move(scheme)),
      m_host(std::move(host)) {}

std::string UrlBuilder::buildUrl(const std::string &endpoint) const {
  if (m_credential)
    return m_scheme + "://" + *m_credential + "@" + m_host + endpoint;
  return m_scheme + "://" + m_host + endpoint;
}

std::string UrlBuilder::resolve(const std::string &fileUrl) const {
  if (fileUrl.rfind("http://", 0) == 0 || fileUrl.rfind("https://", 0) == 0)
    return fileUrl;
  return buildUrl(fileUrl);
}

std::optional<std::string> UrlBuilder::credentialFromEnvironment() {
  const char *value = std::getenv(kAuthEnv);
  if (value == nullptr)
    return std::nullopt;
  return std::string(value);
}

std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      escaped << c;
      continue;
    }
    if (c == ' ') {
      escaped << '+';
      continue;
    }
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

std::string formUrlEncode(const QueryParams &params) {
  std::string encoded;
  for (const auto &[key, value] : params) {
    if (!encoded.empty())
      encoded += '&';
    encoded += urlEncode(key) + "=" + urlEncode(value);
  }
  return encoded;
}

UrlParts parseUrl(const std::string &url) {
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0)
    throw std::invalid_argument("not an absolute URL: " + url);

  UrlParts parts;
  parts.scheme = url.substr(0, schemeEnd);

  auto authorityStart = schemeEnd + 3;
  auto targetStart = url.find_first_of("/?#", authorityStart);
  std::string authority =
      url.substr(authorityStart, targetStart == std::string::npos
                                     ? std::string::npos
                                     : targetStart - authorityStart);

  // last '@', so an unencoded one inside an API key stays in the userinfo
  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    parts.userinfo = authority.substr(0, at);
    parts.host = authority.substr(at + 1);
  } else {
    parts.host = authority;
  }
  if (parts.host.empty())
    throw std::invalid_argument("no host in URL: " + url);

  parts.target =
      targetStart == std::string::npos ? "/" : url.substr(targetStart);
  if (parts.target[0] != '/')
    parts.target = "/" + parts.target;
  return parts;
}

} // namespace danfetch
