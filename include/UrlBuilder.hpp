#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace danfetch {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct UrlParts {
  std::string scheme;
  std::string userinfo; // "login:api_key", empty when absent
  std::string host;     // includes ":port" when given
  std::string target;   // path plus query, at least "/"
};

/**
 * UrlBuilder composes absolute API URLs for the fixed Danbooru host,
 * embedding the optional credential as URL userinfo.
 */
class UrlBuilder {
public:
  static constexpr const char *kScheme = "https";
  static constexpr const char *kHost = "danbooru.donmai.us";
  static constexpr const char *kAuthEnv = "DANBOORU_AUTH";

  explicit UrlBuilder(std::optional<std::string> credential = std::nullopt,
                      std::string scheme = kScheme, std::string host = kHost);

  std::string buildUrl(const std::string &endpoint) const;

  // Absolute file URLs pass through, site-relative ones are built
  std::string resolve(const std::string &fileUrl) const;

  bool hasCredential() const { return m_credential.has_value(); }

  static std::optional<std::string> credentialFromEnvironment();

private:
  std::optional<std::string> m_credential;
  std::string m_scheme;
  std::string m_host;
};

std::string urlEncode(const std::string &value);
std::string formUrlEncode(const QueryParams &params);
UrlParts parseUrl(const std::string &url);

} // namespace danfetch
