#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "HttpClient.hpp"
#include "Logger.hpp"
#include "UrlBuilder.hpp"
#include "types.hpp"

namespace danfetch {

    /**
     * ApiClient fetches and decodes Danbooru JSON resources.
     * Every call throws RequestError on a non-success response, and lets
     * nlohmann::json exceptions through for malformed bodies.
     */
    class ApiClient {
    public:
        ApiClient(HttpClient& http, const UrlBuilder& urls, Logger& log);

        // Throws MissingFileUrl when the post has no file URL
        Post getPost(int64_t id);
        Pool getPool(int64_t id);
        int64_t getPostCount(const std::string& urlEncodedParams);
        // Items stay undecoded so one bad entry only fails that post
        std::vector<nlohmann::json> getPostsPage(const std::vector<std::string>& tags, int64_t page, int limit);

        // File downloads go through the same client and credentials
        void downloadFile(const std::string& fileUrl, const std::string& filename);

        static void assertSuccess(const HttpResponse& response);
        static Post parsePost(const nlohmann::json& item);
        static std::vector<int64_t> parsePostIds(const nlohmann::json& postIds);
        static std::string joinTags(const std::vector<std::string>& tags);

    private:
        nlohmann::json getJson(const std::string& endpoint);

        HttpClient& m_http;
        const UrlBuilder& m_urls;
        Logger& m_log;
    };

} // namespace danfetch
