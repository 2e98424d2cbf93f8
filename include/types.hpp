#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace danfetch {

struct Post {
  int64_t id = 0;
  std::string md5; // empty unless the viewer may see the file
  std::string file_ext;
  std::optional<std::string> file_url;
};

struct Pool {
  int64_t id = 0;
  std::vector<int64_t> post_ids; // pool order
};

struct TagQuery {
  std::vector<std::string> tags;
  int64_t count = 0;
  int64_t pages = 0;
};

struct HttpResponse {
  int status = 0;
  std::string reason;
  std::string body;
  bool success = false;
};

// Outcome of one fetch -> name -> download pipeline
struct ItemResult {
  int64_t id = 0;
  bool ok = false;
  std::string filename;
  std::string error;
};

struct BatchSummary {
  std::size_t attempted = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
};

// Modes of operation
struct PostCommand {
  std::vector<int64_t> ids;
};

struct PoolCommand {
  int64_t id = 0;
  bool md5 = false;
};

struct TagsCommand {
  std::vector<std::string> tags;
};

using Command = std::variant<PostCommand, PoolCommand, TagsCommand>;

struct Options {
  Command command;
  std::string outputDir = ".";
  int verbosity = 0;
};

} // namespace danfetch
