#pragma once

#include <cstddef>
#include <cstdint>
#include "ApiClient.hpp"
#include "FilenameStrategy.hpp"
#include "Logger.hpp"
#include "types.hpp"

namespace danfetch {

/**
 * Downloader drives one run in post, pool or tags mode. Every post goes
 * through fetch -> name -> download on its own; a failing post is reported
 * and the batch moves on. Pool and listing fetch failures end the run.
 */
class Downloader {
public:
  Downloader(ApiClient &api, Logger &log);

  BatchSummary run(const Command &command);

  BatchSummary downloadPosts(const PostCommand &command);
  BatchSummary downloadPool(const PoolCommand &command);
  BatchSummary downloadTags(const TagsCommand &command);

private:
  ItemResult fetchAndDownload(int64_t id, const FilenameStrategy &naming,
                              std::size_t index);
  ItemResult downloadPost(const Post &post, const FilenameStrategy &naming,
                          std::size_t index);
  ItemResult downloadListed(const nlohmann::json &item,
                            const FilenameStrategy &naming, std::size_t index);
  void record(const ItemResult &result, BatchSummary &summary);

  ApiClient &m_api;
  Logger &m_log;
};

} // namespace danfetch
