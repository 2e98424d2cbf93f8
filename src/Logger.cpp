#include "Logger.hpp"

namespace danfetch {

Logger::Logger(int verbosity, std::ostream &out, std::ostream &err)
    : m_verbosity(verbosity), m_out(out), m_err(err) {}

void Logger::progress(const std::string &tag, const std::string &msg) {
  if (!enabled(kProgress))
    return;
  m_out << "[" << tag << "] " << msg << std::endl;
}

void Logger::debug(const std::string &label, const nlohmann::json &data) {
  if (!enabled(kDebug))
    return;
  m_out << "[Debug] " << label << ": " << data.dump() << std::endl;
}

void Logger::error(const std::string &tag, const std::string &msg) {
  m_err << "[" << tag << "] " << msg << std::endl;
}

} // namespace danfetch
