#pragma once

#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

namespace danfetch {

/**
 * Logger writes tagged progress and debug lines according to the
 * configured verbosity. Errors are always written.
 */
class Logger {
public:
  static constexpr int kProgress = 1;
  static constexpr int kDebug = 2;

  explicit Logger(int verbosity = 0, std::ostream &out = std::cout,
                  std::ostream &err = std::cerr);

  int verbosity() const { return m_verbosity; }
  bool enabled(int level) const { return m_verbosity >= level; }

  void progress(const std::string &tag, const std::string &msg);
  void debug(const std::string &label, const nlohmann::json &data);
  void error(const std::string &tag, const std::string &msg);

private:
  int m_verbosity;
  std::ostream &m_out;
  std::ostream &m_err;
};

} // namespace danfetch
