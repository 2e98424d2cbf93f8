#include "Pagination.hpp"
#include <stdexcept>

namespace danfetch {

int64_t pageCount(int64_t count, int pageSize) {
  if (pageSize <= 0)
    throw std::invalid_argument("page size must be positive");
  if (count <= 0)
    return 0;
  return count / pageSize + (count % pageSize != 0);
}

std::vector<int64_t> pageNumbers(int64_t count, int pageSize) {
  std::vector<int64_t> pages;
  int64_t last = pageCount(count, pageSize);
  for (int64_t page = 1; page <= last; ++page)
    pages.push_back(page);
  return pages;
}

} // namespace danfetch
