#pragma once
#include <string>
#include <vector>

namespace RedditDash {

struct Post {
    std::string id;
    std::string title;
    long long score = 0;
    long long commentCount = 0;
    std::string permalink;
    std::string subreddit;  // stamped by the fetcher, never read from the payload

    bool operator==(const Post& other) const {
        return id == other.id && title == other.title && score == other.score &&
               commentCount == other.commentCount && permalink == other.permalink &&
               subreddit == other.subreddit;
    }
    bool operator!=(const Post& other) const { return !(*this == other); }
};

enum class FetchError {
    None,
    NotFound,
    HttpStatus,
    Network,
    Parse,
    Cancelled
};

struct FetchOutcome {
    std::string sourceName;
    bool success = false;
    std::vector<Post> posts;
    FetchError error = FetchError::None;
    int httpStatus = 0;
    std::string reason;  // "not found", "http status 503", "network error", ...
    std::string detail;  // human readable, names the source

    static FetchOutcome ok(const std::string& source, std::vector<Post> posts);
    static FetchOutcome failure(const std::string& source, FetchError error,
                                const std::string& detail, int httpStatus = 0);
};

enum class AggregateErrorKind {
    None,
    Validation,
    SourceFailure,
    Cancelled
};

struct AggregateResult {
    bool success = false;
    std::vector<Post> posts;
    std::string error;
    AggregateErrorKind errorKind = AggregateErrorKind::None;
    std::vector<FetchOutcome> failures;

    bool operator==(const AggregateResult& other) const;
    bool operator!=(const AggregateResult& other) const { return !(*this == other); }
};

std::string fetchErrorReason(FetchError error, int httpStatus);

}
