#include "utils/Config.hpp"
#include "utils/SourceList.hpp"
#include <json-glib/json-glib.h>
#include <glib/gstdio.h>
#include <algorithm>

namespace RedditDash {

static const char* kDefaultBaseUrl = "https://www.reddit.com";
static const char* kDefaultTimeWindow = "week";
static const char* kDefaultUserAgent = "linux:redditdash:1.0 (by /u/redditdash)";

static bool readString(JsonObject* obj, const char* member, std::string& out) {
    if (!json_object_has_member(obj, member)) return false;
    JsonNode* node = json_object_get_member(obj, member);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) return false;
    const char* val = json_node_get_string(node);
    out = val ? val : "";
    return true;
}

static bool readInt(JsonObject* obj, const char* member, long& out) {
    if (!json_object_has_member(obj, member)) return false;
    JsonNode* node = json_object_get_member(obj, member);
    if (!JSON_NODE_HOLDS_VALUE(node)) return false;
    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_INT64) { out = static_cast<long>(json_node_get_int(node)); return true; }
    if (type == G_TYPE_DOUBLE) { out = static_cast<long>(json_node_get_double(node)); return true; }
    return false;
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    configPath_ = defaultConfigPath();
    resetToDefaults();
}

std::string Config::defaultConfigPath() const {
    const char* base = g_get_user_config_dir();
    return std::string(base ? base : ".") + "/redditdash/config.json";
}

std::string Config::getConfigPath() const { return configPath_; }
void Config::setConfigPath(const std::string& path) { configPath_ = path; }

void Config::resetToDefaults() {
    subreddits_.clear();
    baseUrl_ = kDefaultBaseUrl;
    timeWindow_ = kDefaultTimeWindow;
    itemLimit_ = kDefaultItemLimit;
    userAgent_ = kDefaultUserAgent;
    refreshIntervalSeconds_ = kDefaultRefreshIntervalSeconds;
    requestTimeoutSeconds_ = kDefaultRequestTimeoutSeconds;
    cycleTimeoutSeconds_ = 0;
    maxConcurrentFetches_ = 0;
}

void Config::ensureDefaults() {
    if (baseUrl_.empty()) baseUrl_ = kDefaultBaseUrl;
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
    if (timeWindow_.empty()) timeWindow_ = kDefaultTimeWindow;
    if (itemLimit_ <= 0) itemLimit_ = kDefaultItemLimit;
    if (userAgent_.empty()) userAgent_ = kDefaultUserAgent;
    if (refreshIntervalSeconds_ <= 0) refreshIntervalSeconds_ = kDefaultRefreshIntervalSeconds;
    if (requestTimeoutSeconds_ <= 0) requestTimeoutSeconds_ = kDefaultRequestTimeoutSeconds;
    if (cycleTimeoutSeconds_ < 0) cycleTimeoutSeconds_ = 0;
    if (maxConcurrentFetches_ < 0) maxConcurrentFetches_ = 0;
    subreddits_ = normalizeSources(subreddits_);
}

void Config::load() {
    switch (readFile(configPath_)) {
    case LoadStatus::Loaded:
        break;
    case LoadStatus::Unreadable:
        // Missing or broken: start from defaults and write them back
        resetToDefaults();
        save();
        break;
    case LoadStatus::NotAnObject:
        // Leave the file alone
        resetToDefaults();
        break;
    }
}

bool Config::loadFromFile(const std::string& path) {
    return readFile(path) == LoadStatus::Loaded;
}

Config::LoadStatus Config::readFile(const std::string& path) {
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_file(parser, path.c_str(), &error)) {
        if (error) {
            g_debug("Config %s not loaded: %s", path.c_str(), error->message);
            g_error_free(error);
        }
        g_object_unref(parser);
        return LoadStatus::Unreadable;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_warning("Config %s is not a JSON object, using defaults", path.c_str());
        g_object_unref(parser);
        return LoadStatus::NotAnObject;
    }

    resetToDefaults();
    JsonObject* obj = json_node_get_object(root);

    if (json_object_has_member(obj, "subreddits")) {
        JsonNode* node = json_object_get_member(obj, "subreddits");
        if (JSON_NODE_HOLDS_ARRAY(node)) {
            JsonArray* arr = json_node_get_array(node);
            guint len = json_array_get_length(arr);
            for (guint i = 0; i < len; i++) {
                JsonNode* element = json_array_get_element(arr, i);
                if (JSON_NODE_HOLDS_VALUE(element) && json_node_get_value_type(element) == G_TYPE_STRING) {
                    subreddits_.push_back(json_node_get_string(element));
                }
            }
        }
    }

    readString(obj, "baseUrl", baseUrl_);
    readString(obj, "timeWindow", timeWindow_);
    readString(obj, "userAgent", userAgent_);

    long value = 0;
    if (readInt(obj, "itemLimit", value)) itemLimit_ = static_cast<int>(value);
    if (readInt(obj, "refreshIntervalSeconds", value)) refreshIntervalSeconds_ = value;
    if (readInt(obj, "requestTimeoutSeconds", value)) requestTimeoutSeconds_ = value;
    if (readInt(obj, "cycleTimeoutSeconds", value)) cycleTimeoutSeconds_ = value;
    if (readInt(obj, "maxConcurrentFetches", value)) maxConcurrentFetches_ = static_cast<int>(value);

    g_object_unref(parser);
    ensureDefaults();
    return LoadStatus::Loaded;
}

void Config::save() {
    std::string path = configPath_;
    gchar* dir = g_path_get_dirname(path.c_str());
    g_mkdir_with_parents(dir, 0755);
    g_free(dir);
    if (!saveToFile(path)) {
        g_warning("Failed to save config to %s", path.c_str());
    }
}

bool Config::saveToFile(const std::string& path) const {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "subreddits");
    json_builder_begin_array(builder);
    for (const auto& name : subreddits_) {
        json_builder_add_string_value(builder, name.c_str());
    }
    json_builder_end_array(builder);

    json_builder_set_member_name(builder, "baseUrl");
    json_builder_add_string_value(builder, baseUrl_.c_str());
    json_builder_set_member_name(builder, "timeWindow");
    json_builder_add_string_value(builder, timeWindow_.c_str());
    json_builder_set_member_name(builder, "itemLimit");
    json_builder_add_int_value(builder, itemLimit_);
    json_builder_set_member_name(builder, "userAgent");
    json_builder_add_string_value(builder, userAgent_.c_str());
    json_builder_set_member_name(builder, "refreshIntervalSeconds");
    json_builder_add_int_value(builder, refreshIntervalSeconds_);
    json_builder_set_member_name(builder, "requestTimeoutSeconds");
    json_builder_add_int_value(builder, requestTimeoutSeconds_);
    json_builder_set_member_name(builder, "cycleTimeoutSeconds");
    json_builder_add_int_value(builder, cycleTimeoutSeconds_);
    json_builder_set_member_name(builder, "maxConcurrentFetches");
    json_builder_add_int_value(builder, maxConcurrentFetches_);

    json_builder_end_object(builder);

    JsonGenerator* gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    JsonNode* rootNode = json_builder_get_root(builder);
    json_generator_set_root(gen, rootNode);

    GError* error = nullptr;
    gboolean ok = json_generator_to_file(gen, path.c_str(), &error);
    if (error) {
        g_warning("Writing %s failed: %s", path.c_str(), error->message);
        g_error_free(error);
    }

    json_node_unref(rootNode);
    g_object_unref(gen);
    g_object_unref(builder);
    return ok == TRUE;
}

// Subreddits
std::vector<std::string> Config::getSubreddits() const {
    return subreddits_;
}

void Config::setSubreddits(const std::vector<std::string>& subreddits) {
    subreddits_ = normalizeSources(subreddits);
    save();
}

bool Config::setSubredditsFromText(const std::string& raw) {
    auto names = parseSourceList(raw);
    if (names.empty()) return false;
    setSubreddits(names);
    return true;
}

void Config::addSubreddit(const std::string& name) {
    std::string trimmed = trimSourceName(name);
    if (trimmed.empty()) return;
    for (const auto& s : subreddits_) {
        if (s == trimmed) return;
    }
    subreddits_.push_back(trimmed);
    save();
}

void Config::removeSubreddit(const std::string& name) {
    subreddits_.erase(std::remove(subreddits_.begin(), subreddits_.end(), trimSourceName(name)),
                      subreddits_.end());
    save();
}

// Upstream query
std::string Config::getBaseUrl() const { return baseUrl_; }

void Config::setBaseUrl(const std::string& url) {
    baseUrl_ = url;
    ensureDefaults();
    save();
}

std::string Config::getTimeWindow() const { return timeWindow_; }

void Config::setTimeWindow(const std::string& window) {
    timeWindow_ = window;
    ensureDefaults();
    save();
}

int Config::getItemLimit() const { return itemLimit_; }

void Config::setItemLimit(int limit) {
    itemLimit_ = limit;
    ensureDefaults();
    save();
}

std::string Config::getUserAgent() const { return userAgent_; }

void Config::setUserAgent(const std::string& userAgent) {
    userAgent_ = userAgent;
    ensureDefaults();
    save();
}

// Scheduling and fan-out
long Config::getRefreshIntervalSeconds() const { return refreshIntervalSeconds_; }

void Config::setRefreshIntervalSeconds(long seconds) {
    refreshIntervalSeconds_ = seconds;
    ensureDefaults();
    save();
}

long Config::getRequestTimeoutSeconds() const { return requestTimeoutSeconds_; }

void Config::setRequestTimeoutSeconds(long seconds) {
    requestTimeoutSeconds_ = seconds;
    ensureDefaults();
    save();
}

long Config::getCycleTimeoutSeconds() const { return cycleTimeoutSeconds_; }

void Config::setCycleTimeoutSeconds(long seconds) {
    cycleTimeoutSeconds_ = seconds;
    ensureDefaults();
    save();
}

int Config::getMaxConcurrentFetches() const { return maxConcurrentFetches_; }

void Config::setMaxConcurrentFetches(int count) {
    maxConcurrentFetches_ = count;
    ensureDefaults();
    save();
}

}
