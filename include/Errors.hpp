#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace danfetch {

// Non-success HTTP status, or a transport failure reported as 599
class RequestError : public std::runtime_error {
public:
  RequestError(int status, const std::string &reason)
      : std::runtime_error(std::to_string(status) + " " + reason),
        m_status(status), m_reason(reason) {}

  int status() const { return m_status; }
  const std::string &reason() const { return m_reason; }

private:
  int m_status;
  std::string m_reason;
};

// file_url absent: deleted post, or restricted for the current user
class MissingFileUrl : public std::runtime_error {
public:
  explicit MissingFileUrl(int64_t postId)
      : std::runtime_error("no file URL for post " + std::to_string(postId)) {}
};

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace danfetch
