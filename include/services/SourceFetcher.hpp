#pragma once
#include <memory>
#include <string>
#include <vector>
#include "services/Post.hpp"

namespace RedditDash {

class CancellationFlag;
class HttpClient;

// One attempt per call. Implementations must not touch shared state:
// the aggregator calls fetch() from several threads at once.
class SourceFetcher {
public:
    virtual ~SourceFetcher() = default;
    virtual FetchOutcome fetch(const std::string& sourceName, const CancellationFlag* cancel) = 0;
};

class RedditFetcher : public SourceFetcher {
public:
    struct Options {
        std::string baseUrl = "https://www.reddit.com";
        std::string timeWindow = "week";
        int limit = 10;
    };

    explicit RedditFetcher(std::shared_ptr<HttpClient> client);
    RedditFetcher(std::shared_ptr<HttpClient> client, Options options);

    FetchOutcome fetch(const std::string& sourceName, const CancellationFlag* cancel) override;

    std::string buildUrl(const std::string& sourceName) const;

    // Reads data.children[].data from a listing body; false on malformed input.
    static bool parseListing(const std::string& body, const std::string& sourceName,
                             size_t limit, std::vector<Post>& out);

private:
    std::shared_ptr<HttpClient> client_;
    Options options_;
};

}
