#include "ApiClient.hpp"
#include "Errors.hpp"
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace danfetch {

ApiClient::ApiClient(HttpClient &http, const UrlBuilder &urls, Logger &log)
    : m_http(http), m_urls(urls), m_log(log) {}

void ApiClient::assertSuccess(const HttpResponse &response) {
  if (!response.success)
    throw RequestError(response.status, response.reason);
}

json ApiClient::getJson(const std::string &endpoint) {
  auto res = m_http.get(m_urls.buildUrl(endpoint));
  if (!res.success) {
    m_log.debug("request failed", {{"endpoint", endpoint},
                                   {"status", res.status},
                                   {"reason", res.reason},
                                   {"content", res.body}});
  }
  assertSuccess(res);
  return json::parse(res.body);
}

Post ApiClient::getPost(int64_t id) {
  m_log.debug("getPost", json::array({id}));

  Post post = parsePost(getJson("/posts/" + std::to_string(id) + ".json"));
  if (!post.file_url)
    throw MissingFileUrl(id);
  return post;
}

Pool ApiClient::getPool(int64_t id) {
  m_log.debug("getPool", json::array({id}));

  auto data = getJson("/pools/" + std::to_string(id) + ".json");
  Pool pool;
  pool.id = data.value("id", id);
  pool.post_ids = parsePostIds(data.at("post_ids"));
  return pool;
}

int64_t ApiClient::getPostCount(const std::string &urlEncodedParams) {
  m_log.debug("getPostCount", json::array({urlEncodedParams}));

  auto data = getJson("/counts/posts.json?" + urlEncodedParams);
  return data.at("counts").at("posts").get<int64_t>();
}

std::vector<json> ApiClient::getPostsPage(const std::vector<std::string> &tags,
                                          int64_t page, int limit) {
  std::string params = formUrlEncode({{"tags", joinTags(tags)},
                                      {"page", std::to_string(page)},
                                      {"limit", std::to_string(limit)}});
  m_log.debug("getPostsPage", json::array({params}));

  auto data = getJson("/posts.json?" + params);
  if (!data.is_array())
    throw std::runtime_error("post listing for page " + std::to_string(page) +
                             " is not an array");

  return data.get<std::vector<json>>();
}

void ApiClient::downloadFile(const std::string &fileUrl,
                             const std::string &filename) {
  m_log.progress("Download", fileUrl + " => " + filename);

  auto res = m_http.mirror(m_urls.resolve(fileUrl), filename);
  if (!res.success) {
    m_log.debug("request failed", {{"url", fileUrl},
                                   {"status", res.status},
                                   {"reason", res.reason}});
  }
  assertSuccess(res);

  m_log.progress("Download", res.status == 304 ? "unchanged" : "done");
}

Post ApiClient::parsePost(const json &item) {
  Post post;
  post.id = item.at("id").get<int64_t>();
  if (item.contains("md5") && item["md5"].is_string())
    post.md5 = item["md5"].get<std::string>();
  if (item.contains("file_ext") && item["file_ext"].is_string())
    post.file_ext = item["file_ext"].get<std::string>();
  if (item.contains("file_url") && item["file_url"].is_string()) {
    std::string url = item["file_url"];
    if (!url.empty())
      post.file_url = url;
  }
  return post;
}

std::vector<int64_t> ApiClient::parsePostIds(const json &postIds) {
  std::vector<int64_t> ids;

  // current API versions send an array, older ones a space-delimited string
  if (postIds.is_array()) {
    for (const auto &item : postIds) {
      int64_t id = item.get<int64_t>();
      if (id <= 0)
        throw std::runtime_error("invalid post id in pool: " + item.dump());
      ids.push_back(id);
    }
    return ids;
  }

  std::stringstream ss(postIds.get<std::string>());
  std::string item;
  while (std::getline(ss, item, ' ')) {
    if (item.empty())
      continue;
    std::size_t consumed = 0;
    int64_t id = std::stoll(item, &consumed);
    if (consumed != item.size() || id <= 0)
      throw std::runtime_error("invalid post id in pool: " + item);
    ids.push_back(id);
  }
  return ids;
}

std::string ApiClient::joinTags(const std::vector<std::string> &tags) {
  std::string joined;
  for (const auto &tag : tags) {
    if (!joined.empty())
      joined += ' ';
    joined += tag;
  }
  return joined;
}

} // namespace danfetch
