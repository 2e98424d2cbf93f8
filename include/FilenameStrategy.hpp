#pragma once

#include <cstddef>
#include <string>
#include "types.hpp"

namespace danfetch {

/**
 * FilenameStrategy derives output filenames for one batch. MD5 naming uses
 * the post checksum; sequence naming uses the post's position in the batch,
 * zero-padded to the width of the last index.
 */
class FilenameStrategy {
public:
  enum class Kind { Md5, Sequence };

  static FilenameStrategy md5();
  static FilenameStrategy sequence(std::size_t batchSize);

  Kind kind() const { return m_kind; }
  int width() const { return m_width; }

  // Throws std::runtime_error when the post lacks a field the name needs
  std::string filenameFor(const Post &post, std::size_t index) const;

private:
  FilenameStrategy(Kind kind, int width) : m_kind(kind), m_width(width) {}

  Kind m_kind;
  int m_width;
};

int decimalWidth(std::size_t n);
std::string padNumber(int width, std::size_t n);

} // namespace danfetch
