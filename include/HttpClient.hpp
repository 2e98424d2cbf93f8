#pragma once

#include <memory>
#include <string>
#include "types.hpp"

namespace danfetch {

/**
 * HttpClient performs blocking requests against absolute URLs. Userinfo in
 * the URL is sent as basic authentication.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(const std::string &url) = 0;

  // Conditional download to disk. A 304 for an existing file is a success
  // that transfers nothing; an existing file is only replaced once the new
  // body has been received completely.
  virtual HttpResponse mirror(const std::string &url,
                              const std::string &filename) = 0;
};

/**
 * HttplibClient is the cpp-httplib implementation of HttpClient.
 */
class HttplibClient : public HttpClient {
public:
  explicit HttplibClient(int timeoutSeconds = 30);
  ~HttplibClient() override;

  HttpResponse get(const std::string &url) override;
  HttpResponse mirror(const std::string &url,
                      const std::string &filename) override;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace danfetch
