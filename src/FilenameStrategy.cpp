#include "FilenameStrategy.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace danfetch {

FilenameStrategy FilenameStrategy::md5() { return {Kind::Md5, 0}; }

FilenameStrategy FilenameStrategy::sequence(std::size_t batchSize) {
  // indices run 0..n-1
  return {Kind::Sequence, decimalWidth(batchSize == 0 ? 0 : batchSize - 1)};
}

std::string FilenameStrategy::filenameFor(const Post &post,
                                          std::size_t index) const {
  if (post.file_ext.empty())
    throw std::runtime_error("no file extension for post " +
                             std::to_string(post.id));

  if (m_kind == Kind::Sequence)
    return padNumber(m_width, index) + "." + post.file_ext;

  if (post.md5.empty())
    throw std::runtime_error("no MD5 checksum for post " +
                             std::to_string(post.id));
  return post.md5 + "." + post.file_ext;
}

int decimalWidth(std::size_t n) {
  int width = 1;
  while (n >= 10) {
    n /= 10;
    ++width;
  }
  return width;
}

std::string padNumber(int width, std::size_t n) {
  std::ostringstream padded;
  padded << std::setfill('0') << std::setw(width) << n;
  return padded.str();
}

} // namespace danfetch
