#include "HttpClient.hpp"
#include "UrlBuilder.hpp"
#include "httplib.h"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <utime.h>

namespace fs = std::filesystem;

namespace danfetch {

namespace {

// HTTP::Tiny and friends report client-side failures the same way
constexpr int kInternalError = 599;

HttpResponse internalError(const std::string &reason) {
  return {kInternalError, reason, "", false};
}

std::string formatHttpDate(std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  return buf;
}

bool parseHttpDate(const std::string &value, std::time_t &out) {
  std::tm tm{};
  const char *end = strptime(value.c_str(), "%a, %d %b %Y %H:%M:%S", &tm);
  if (end == nullptr)
    return false;
  out = timegm(&tm);
  return true;
}

bool isSuccess(int status) { return status >= 200 && status < 300; }

} // namespace

struct HttplibClient::Impl {
  int timeout;

  explicit Impl(int timeoutSeconds) : timeout(timeoutSeconds) {}

  std::unique_ptr<httplib::Client> connect(const UrlParts &parts) const {
    auto client =
        std::make_unique<httplib::Client>(parts.scheme + "://" + parts.host);
    client->set_connection_timeout(timeout, 0);
    client->set_read_timeout(timeout, 0);
    client->set_write_timeout(timeout, 0);
    client->set_follow_location(true);
    if (!parts.userinfo.empty()) {
      auto colon = parts.userinfo.find(':');
      client->set_basic_auth(parts.userinfo.substr(0, colon),
                             colon == std::string::npos
                                 ? std::string()
                                 : parts.userinfo.substr(colon + 1));
    }
    return client;
  }
};

HttplibClient::HttplibClient(int timeoutSeconds)
    : m_impl(std::make_unique<Impl>(timeoutSeconds)) {}

HttplibClient::~HttplibClient() = default;

HttpResponse HttplibClient::get(const std::string &url) {
  UrlParts parts;
  try {
    parts = parseUrl(url);
  } catch (const std::invalid_argument &e) {
    return internalError(e.what());
  }

  auto client = m_impl->connect(parts);
  auto res = client->Get(parts.target);
  if (!res)
    return internalError(httplib::to_string(res.error()));

  return {res->status, res->reason, res->body, isSuccess(res->status)};
}

HttpResponse HttplibClient::mirror(const std::string &url,
                                   const std::string &filename) {
  UrlParts parts;
  try {
    parts = parseUrl(url);
  } catch (const std::invalid_argument &e) {
    return internalError(e.what());
  }

  httplib::Headers headers;
  struct stat st;
  if (stat(filename.c_str(), &st) == 0)
    headers.emplace("If-Modified-Since", formatHttpDate(st.st_mtime));

  const std::string tempName = filename + ".part";
  std::ofstream ofs(tempName, std::ios::binary | std::ios::trunc);
  if (!ofs)
    return internalError("cannot open " + tempName + " for writing");

  int status = 0;
  auto client = m_impl->connect(parts);
  auto res = client->Get(
      parts.target, headers,
      [&](const httplib::Response &response) {
        status = response.status;
        return true;
      },
      [&](const char *data, size_t data_length) {
        // redirects and error pages also stream through here
        if (isSuccess(status))
          ofs.write(data, data_length);
        return static_cast<bool>(ofs);
      });
  ofs.close();

  std::error_code ec;
  if (!res) {
    fs::remove(tempName, ec);
    return internalError(httplib::to_string(res.error()));
  }

  HttpResponse response{res->status, res->reason, "", false};
  if (res->status == 304) {
    fs::remove(tempName, ec);
    response.success = true;
    return response;
  }
  if (!isSuccess(res->status)) {
    fs::remove(tempName, ec);
    return response;
  }
  if (ofs.fail()) {
    fs::remove(tempName, ec);
    return internalError("error writing " + tempName);
  }

  fs::rename(tempName, filename, ec);
  if (ec) {
    fs::remove(tempName, ec);
    return internalError("cannot rename " + tempName + " to " + filename);
  }

  std::time_t modified;
  if (res->has_header("Last-Modified") &&
      parseHttpDate(res->get_header_value("Last-Modified"), modified)) {
    struct utimbuf times;
    times.actime = modified;
    times.modtime = modified;
    if (utime(filename.c_str(), &times) != 0)
      response.reason += " (mtime not updated)";
  }

  response.success = true;
  return response;
}

} // namespace danfetch
