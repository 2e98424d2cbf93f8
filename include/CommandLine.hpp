#pragma once

#include <cstdint>
#include <string>
#include "types.hpp"

namespace danfetch {

struct ParsedCommandLine {
  Options options;
  bool help = false;
};

// Throws UsageError on an unknown mode, bad option or bad argument
ParsedCommandLine parseCommandLine(int argc, char *argv[]);

std::string usageText(const std::string &program);

int64_t parsePositiveId(const std::string &text);

} // namespace danfetch
