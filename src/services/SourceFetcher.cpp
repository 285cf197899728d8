#include "services/SourceFetcher.hpp"
#include "utils/HttpClient.hpp"
#include "utils/CancellationFlag.hpp"
#include <json-glib/json-glib.h>
#include <cctype>
#include <cstdio>
#include <utility>

namespace RedditDash {

// URL-encode a path segment
static std::string urlEncode(const std::string& str) {
    std::string result;
    for (unsigned char c : str) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += c;
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            result += buf;
        }
    }
    return result;
}

static JsonObject* getObjectMember(JsonObject* obj, const char* member) {
    if (!obj || !json_object_has_member(obj, member)) return nullptr;
    JsonNode* node = json_object_get_member(obj, member);
    return JSON_NODE_HOLDS_OBJECT(node) ? json_node_get_object(node) : nullptr;
}

static bool getStringMember(JsonObject* obj, const char* member, std::string& out) {
    if (!json_object_has_member(obj, member)) return false;
    JsonNode* node = json_object_get_member(obj, member);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) return false;
    const char* val = json_node_get_string(node);
    out = val ? val : "";
    return true;
}

// Counts come back as integers, but doubles are accepted too
static long long getCountMember(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) return 0;
    JsonNode* node = json_object_get_member(obj, member);
    if (!JSON_NODE_HOLDS_VALUE(node)) return 0;
    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_INT64) return json_node_get_int(node);
    if (type == G_TYPE_DOUBLE) return static_cast<long long>(json_node_get_double(node));
    return 0;
}

RedditFetcher::RedditFetcher(std::shared_ptr<HttpClient> client)
    : RedditFetcher(std::move(client), Options()) {}

RedditFetcher::RedditFetcher(std::shared_ptr<HttpClient> client, Options options)
    : client_(std::move(client)), options_(std::move(options)) {
    if (options_.limit <= 0) options_.limit = 10;
    while (!options_.baseUrl.empty() && options_.baseUrl.back() == '/') options_.baseUrl.pop_back();
}

std::string RedditFetcher::buildUrl(const std::string& sourceName) const {
    return options_.baseUrl + "/r/" + urlEncode(sourceName) + "/top.json?t=" +
           urlEncode(options_.timeWindow) + "&limit=" + std::to_string(options_.limit);
}

bool RedditFetcher::parseListing(const std::string& body, const std::string& sourceName,
                                 size_t limit, std::vector<Post>& out) {
    out.clear();
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_data(parser, body.c_str(), static_cast<gssize>(body.size()), &error)) {
        if (error) {
            g_debug("r/%s: invalid JSON: %s", sourceName.c_str(), error->message);
            g_error_free(error);
        }
        g_object_unref(parser);
        return false;
    }

    bool valid = false;
    JsonNode* root = json_parser_get_root(parser);
    if (root && JSON_NODE_HOLDS_OBJECT(root)) {
        JsonObject* listing = getObjectMember(json_node_get_object(root), "data");
        if (listing && json_object_has_member(listing, "children")) {
            JsonNode* childrenNode = json_object_get_member(listing, "children");
            if (JSON_NODE_HOLDS_ARRAY(childrenNode)) {
                JsonArray* children = json_node_get_array(childrenNode);
                guint len = json_array_get_length(children);
                valid = true;
                for (guint i = 0; i < len && out.size() < limit; i++) {
                    JsonNode* childNode = json_array_get_element(children, i);
                    JsonObject* data = JSON_NODE_HOLDS_OBJECT(childNode)
                        ? getObjectMember(json_node_get_object(childNode), "data")
                        : nullptr;
                    if (!data) { valid = false; break; }

                    Post post;
                    if (!getStringMember(data, "id", post.id)) { valid = false; break; }
                    getStringMember(data, "title", post.title);
                    getStringMember(data, "permalink", post.permalink);
                    post.score = getCountMember(data, "ups");
                    post.commentCount = getCountMember(data, "num_comments");
                    if (post.commentCount < 0) post.commentCount = 0;
                    post.subreddit = sourceName;
                    out.push_back(std::move(post));
                }
            }
        }
    }

    g_object_unref(parser);
    if (!valid) out.clear();
    return valid;
}

FetchOutcome RedditFetcher::fetch(const std::string& sourceName, const CancellationFlag* cancel) {
    auto response = client_->get(buildUrl(sourceName), cancel);

    if (response.cancelled) {
        return FetchOutcome::failure(sourceName, FetchError::Cancelled,
                                     "Fetching posts from r/" + sourceName + " was cancelled.");
    }

    if (response.statusCode == 0) {
        g_warning("Error fetching posts from r/%s: %s", sourceName.c_str(), response.error.c_str());
        return FetchOutcome::failure(sourceName, FetchError::Network,
                                     "Failed to fetch posts from r/" + sourceName + ": " + response.error);
    }

    if (!response.success) {
        std::string detail = "Failed to fetch posts from r/" + sourceName +
                             ". Status: " + std::to_string(response.statusCode);
        g_warning("Error fetching posts from r/%s: %s", sourceName.c_str(), detail.c_str());
        FetchError kind = response.statusCode == 404 ? FetchError::NotFound : FetchError::HttpStatus;
        return FetchOutcome::failure(sourceName, kind, detail, response.statusCode);
    }

    std::vector<Post> posts;
    if (!parseListing(response.body, sourceName, static_cast<size_t>(options_.limit), posts)) {
        g_warning("Error fetching posts from r/%s: unparseable response", sourceName.c_str());
        return FetchOutcome::failure(sourceName, FetchError::Parse,
                                     "Failed to parse posts from r/" + sourceName + ".",
                                     response.statusCode);
    }

    g_debug("r/%s: %zu posts", sourceName.c_str(), posts.size());
    return FetchOutcome::ok(sourceName, std::move(posts));
}

}
