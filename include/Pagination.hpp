#pragma once

#include <cstdint>
#include <vector>

namespace danfetch {

constexpr int kPostsPerPage = 20;

// ceil(count / pageSize); zero or negative counts yield no pages
int64_t pageCount(int64_t count, int pageSize = kPostsPerPage);

// Page numbers in request order, starting at 1
std::vector<int64_t> pageNumbers(int64_t count, int pageSize = kPostsPerPage);

} // namespace danfetch
