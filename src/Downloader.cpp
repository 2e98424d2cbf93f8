#include "Downloader.hpp"
#include "Errors.hpp"
#include "Pagination.hpp"
#include "UrlBuilder.hpp"
#include <exception>
#include <variant>

namespace danfetch {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Downloader::Downloader(ApiClient &api, Logger &log) : m_api(api), m_log(log) {}

BatchSummary Downloader::run(const Command &command) {
  return std::visit(
      overloaded{
          [this](const PostCommand &c) { return downloadPosts(c); },
          [this](const PoolCommand &c) { return downloadPool(c); },
          [this](const TagsCommand &c) { return downloadTags(c); },
      },
      command);
}

BatchSummary Downloader::downloadPosts(const PostCommand &command) {
  BatchSummary summary;
  const auto naming = FilenameStrategy::md5();

  for (std::size_t i = 0; i < command.ids.size(); ++i)
    record(fetchAndDownload(command.ids[i], naming, i), summary);
  return summary;
}

BatchSummary Downloader::downloadPool(const PoolCommand &command) {
  m_log.progress("Pool", "pool " + std::to_string(command.id));

  Pool pool = m_api.getPool(command.id);
  const auto naming = command.md5
                          ? FilenameStrategy::md5()
                          : FilenameStrategy::sequence(pool.post_ids.size());

  // the index follows pool position, failed posts included
  BatchSummary summary;
  for (std::size_t index = 0; index < pool.post_ids.size(); ++index)
    record(fetchAndDownload(pool.post_ids[index], naming, index), summary);
  return summary;
}

BatchSummary Downloader::downloadTags(const TagsCommand &command) {
  TagQuery query;
  query.tags = command.tags;
  m_log.progress("Tags", "search " + ApiClient::joinTags(query.tags));

  query.count = m_api.getPostCount(
      formUrlEncode({{"tags", ApiClient::joinTags(query.tags)}}));
  query.pages = pageCount(query.count);
  m_log.progress("Tags", std::to_string(query.count) + " posts on " +
                             std::to_string(query.pages) + " pages");

  BatchSummary summary;
  const auto naming = FilenameStrategy::md5();
  std::size_t index = 0;
  for (int64_t page : pageNumbers(query.count)) {
    // a failed listing aborts the whole search
    auto items = m_api.getPostsPage(query.tags, page, kPostsPerPage);
    for (const auto &item : items)
      record(downloadListed(item, naming, index++), summary);
  }
  return summary;
}

ItemResult Downloader::fetchAndDownload(int64_t id,
                                        const FilenameStrategy &naming,
                                        std::size_t index) {
  m_log.progress("Post", "post " + std::to_string(id));

  Post post;
  try {
    post = m_api.getPost(id);
  } catch (const std::exception &e) {
    return {id, false, "", e.what()};
  }
  return downloadPost(post, naming, index);
}

ItemResult Downloader::downloadListed(const nlohmann::json &item,
                                      const FilenameStrategy &naming,
                                      std::size_t index) {
  Post post;
  try {
    post = ApiClient::parsePost(item);
  } catch (const std::exception &e) {
    int64_t id = 0;
    if (item.is_object() && item.contains("id") &&
        item["id"].is_number_integer())
      id = item["id"].get<int64_t>();
    return {id, false, "", "undecodable listing entry " + item.dump() + ", " +
                               e.what()};
  }

  m_log.progress("Post", "post " + std::to_string(post.id));
  return downloadPost(post, naming, index);
}

ItemResult Downloader::downloadPost(const Post &post,
                                    const FilenameStrategy &naming,
                                    std::size_t index) {
  ItemResult result{post.id, false, "", ""};
  try {
    if (!post.file_url)
      throw MissingFileUrl(post.id);
    result.filename = naming.filenameFor(post, index);
    m_api.downloadFile(*post.file_url, result.filename);
    result.ok = true;
  } catch (const std::exception &e) {
    result.error = e.what();
  }
  return result;
}

void Downloader::record(const ItemResult &result, BatchSummary &summary) {
  ++summary.attempted;
  if (result.ok) {
    ++summary.succeeded;
    return;
  }
  ++summary.failed;
  m_log.error("Download", "error downloading post " + std::to_string(result.id) +
                              ", " + result.error);
}

} // namespace danfetch
