#include "ApiClient.hpp"
#include "Errors.hpp"
#include "FakeHttpClient.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace danfetch;
using danfetch::test::FakeHttpClient;

namespace {

const std::string kBase = "https://danbooru.donmai.us";

class ApiClientTest : public ::testing::Test {
protected:
  ApiClientTest() : log(0, out, err), api(http, urls, log) {}

  FakeHttpClient http;
  UrlBuilder urls;
  std::ostringstream out;
  std::ostringstream err;
  Logger log;
  ApiClient api;
};

} // namespace

TEST_F(ApiClientTest, GetPostDecodesMetadata) {
  http.respondJson(kBase + "/posts/7.json",
                   R"({"id": 7, "md5": "abc", "file_ext": "png",
                       "file_url": "https://cdn.donmai.us/abc.png"})");

  Post post = api.getPost(7);
  EXPECT_EQ(post.id, 7);
  EXPECT_EQ(post.md5, "abc");
  EXPECT_EQ(post.file_ext, "png");
  ASSERT_TRUE(post.file_url.has_value());
  EXPECT_EQ(*post.file_url, "https://cdn.donmai.us/abc.png");
  EXPECT_EQ(http.gets, std::vector<std::string>{kBase + "/posts/7.json"});
}

TEST_F(ApiClientTest, GetPostWithoutFileUrlFails) {
  http.respondJson(kBase + "/posts/8.json",
                   R"({"id": 8, "file_ext": "jpg"})");
  EXPECT_THROW(api.getPost(8), MissingFileUrl);

  http.respondJson(kBase + "/posts/9.json",
                   R"({"id": 9, "md5": "x", "file_ext": "jpg", "file_url": ""})");
  EXPECT_THROW(api.getPost(9), MissingFileUrl);
}

TEST_F(ApiClientTest, FailedRequestCarriesStatusAndReason) {
  http.respondStatus(kBase + "/posts/10.json", 403, "Forbidden");
  try {
    api.getPost(10);
    FAIL() << "expected RequestError";
  } catch (const RequestError &e) {
    EXPECT_EQ(e.status(), 403);
    EXPECT_EQ(e.reason(), "Forbidden");
    EXPECT_STREQ(e.what(), "403 Forbidden");
  }
}

TEST_F(ApiClientTest, MalformedJsonFails) {
  http.respondJson(kBase + "/posts/11.json", "<html>oops</html>");
  EXPECT_THROW(api.getPost(11), nlohmann::json::exception);
}

TEST_F(ApiClientTest, GetPoolSplitsPostIds) {
  http.respondJson(kBase + "/pools/42.json",
                   R"({"id": 42, "post_ids": "3 1 2"})");
  Pool pool = api.getPool(42);
  EXPECT_EQ(pool.id, 42);
  EXPECT_EQ(pool.post_ids, (std::vector<int64_t>{3, 1, 2}));
}

TEST_F(ApiClientTest, GetPoolAcceptsArrayAndEmpty) {
  http.respondJson(kBase + "/pools/1.json", R"({"id": 1, "post_ids": [5, 4]})");
  EXPECT_EQ(api.getPool(1).post_ids, (std::vector<int64_t>{5, 4}));

  http.respondJson(kBase + "/pools/2.json", R"({"id": 2, "post_ids": ""})");
  EXPECT_TRUE(api.getPool(2).post_ids.empty());
}

TEST_F(ApiClientTest, GetPoolRejectsGarbageIds) {
  http.respondJson(kBase + "/pools/3.json", R"({"id": 3, "post_ids": "1 x"})");
  EXPECT_ANY_THROW(api.getPool(3));

  http.respondJson(kBase + "/pools/4.json", R"({"id": 4, "post_ids": [1, 0]})");
  EXPECT_THROW(api.getPool(4), std::runtime_error);

  http.respondJson(kBase + "/pools/5.json", R"({"id": 5, "post_ids": [-7]})");
  EXPECT_THROW(api.getPool(5), std::runtime_error);
}

TEST_F(ApiClientTest, GetPostCount) {
  http.respondJson(kBase + "/counts/posts.json?tags=foo+bar",
                   R"({"counts": {"posts": 45}})");
  EXPECT_EQ(api.getPostCount("tags=foo+bar"), 45);

  http.respondJson(kBase + "/counts/posts.json?tags=baz", R"({"counts": {}})");
  EXPECT_THROW(api.getPostCount("tags=baz"), nlohmann::json::exception);
}

TEST_F(ApiClientTest, GetPostsPageBuildsListingQuery) {
  http.respondJson(kBase + "/posts.json?tags=foo+bar&page=2&limit=20",
                   R"([{"id": 1, "md5": "a", "file_ext": "jpg", "file_url": "u1"},
                       {"id": 2, "file_ext": "jpg"}])");

  auto items = api.getPostsPage({"foo", "bar"}, 2, 20);
  ASSERT_EQ(items.size(), 2u);
  Post first = ApiClient::parsePost(items[0]);
  EXPECT_EQ(first.id, 1);
  EXPECT_TRUE(first.file_url.has_value());
  Post second = ApiClient::parsePost(items[1]);
  EXPECT_EQ(second.id, 2);
  EXPECT_FALSE(second.file_url.has_value());
}

TEST_F(ApiClientTest, GetPostsPageLeavesBadItemsUndecoded) {
  http.respondJson(kBase + "/posts.json?tags=foo&page=1&limit=20",
                   R"([{"id": null}, {"id": 9, "file_ext": "jpg"}])");

  auto items = api.getPostsPage({"foo"}, 1, 20);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_THROW(ApiClient::parsePost(items[0]), nlohmann::json::exception);
  EXPECT_EQ(ApiClient::parsePost(items[1]).id, 9);
}

TEST_F(ApiClientTest, GetPostsPageRequiresArray) {
  http.respondJson(kBase + "/posts.json?tags=foo&page=1&limit=20",
                   R"({"success": false})");
  EXPECT_THROW(api.getPostsPage({"foo"}, 1, 20), std::runtime_error);
}

TEST_F(ApiClientTest, DownloadFileMirrorsResolvedUrl) {
  api.downloadFile("https://cdn.donmai.us/abc.png", "abc.png");
  api.downloadFile("/data/def.jpg", "def.jpg");

  ASSERT_EQ(http.mirrors.size(), 2u);
  EXPECT_EQ(http.mirrors[0].first, "https://cdn.donmai.us/abc.png");
  EXPECT_EQ(http.mirrors[0].second, "abc.png");
  EXPECT_EQ(http.mirrors[1].first, kBase + "/data/def.jpg");
}

TEST_F(ApiClientTest, DownloadFileFailureThrows) {
  http.failMirror("https://cdn.donmai.us/gone.png", 404, "Not Found");
  EXPECT_THROW(api.downloadFile("https://cdn.donmai.us/gone.png", "gone.png"),
               RequestError);
}

TEST_F(ApiClientTest, DebugOutputOnlyAtDebugVerbosity) {
  http.respondJson(kBase + "/posts/7.json",
                   R"({"id": 7, "md5": "abc", "file_ext": "png", "file_url": "u"})");
  api.getPost(7);
  EXPECT_TRUE(out.str().empty());

  std::ostringstream debugOut;
  Logger debugLog(Logger::kDebug, debugOut, err);
  ApiClient debugApi(http, urls, debugLog);
  debugApi.getPost(7);
  EXPECT_NE(debugOut.str().find("getPost: [7]"), std::string::npos);
}

TEST(ApiClientStaticTest, JoinTags) {
  EXPECT_EQ(ApiClient::joinTags({"foo", "bar"}), "foo bar");
  EXPECT_EQ(ApiClient::joinTags({"solo"}), "solo");
}
