#include "services/Post.hpp"
#include <utility>

namespace RedditDash {

std::string fetchErrorReason(FetchError error, int httpStatus) {
    switch (error) {
        case FetchError::None: return "";
        case FetchError::NotFound: return "not found";
        case FetchError::HttpStatus: return "http status " + std::to_string(httpStatus);
        case FetchError::Network: return "network error";
        case FetchError::Parse: return "parse error";
        case FetchError::Cancelled: return "cancelled";
    }
    return "";
}

FetchOutcome FetchOutcome::ok(const std::string& source, std::vector<Post> posts) {
    FetchOutcome outcome;
    outcome.sourceName = source;
    outcome.success = true;
    outcome.posts = std::move(posts);
    return outcome;
}

FetchOutcome FetchOutcome::failure(const std::string& source, FetchError error,
                                   const std::string& detail, int httpStatus) {
    FetchOutcome outcome;
    outcome.sourceName = source;
    outcome.success = false;
    outcome.error = error;
    outcome.httpStatus = httpStatus;
    outcome.reason = fetchErrorReason(error, httpStatus);
    outcome.detail = detail;
    return outcome;
}

static bool sameOutcome(const FetchOutcome& a, const FetchOutcome& b) {
    return a.sourceName == b.sourceName && a.success == b.success && a.posts == b.posts &&
           a.error == b.error && a.httpStatus == b.httpStatus && a.reason == b.reason &&
           a.detail == b.detail;
}

bool AggregateResult::operator==(const AggregateResult& other) const {
    if (success != other.success || posts != other.posts || error != other.error ||
        errorKind != other.errorKind || failures.size() != other.failures.size()) {
        return false;
    }
    for (size_t i = 0; i < failures.size(); ++i) {
        if (!sameOutcome(failures[i], other.failures[i])) return false;
    }
    return true;
}

}
