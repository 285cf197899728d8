#pragma once
#include <string>
#include <vector>

namespace RedditDash {

class Config {
public:
    static Config& getInstance();

    static constexpr long kDefaultRefreshIntervalSeconds = 7L * 24 * 60 * 60;
    static constexpr int kDefaultItemLimit = 10;
    static constexpr long kDefaultRequestTimeoutSeconds = 30;

    // Subreddits
    std::vector<std::string> getSubreddits() const;
    void setSubreddits(const std::vector<std::string>& subreddits);
    // Parses a comma-separated list; a list with no names is rejected and nothing is saved
    bool setSubredditsFromText(const std::string& raw);
    void addSubreddit(const std::string& name);
    void removeSubreddit(const std::string& name);

    // Upstream query
    std::string getBaseUrl() const;
    void setBaseUrl(const std::string& url);
    std::string getTimeWindow() const;
    void setTimeWindow(const std::string& window);
    int getItemLimit() const;
    void setItemLimit(int limit);
    std::string getUserAgent() const;
    void setUserAgent(const std::string& userAgent);

    // Scheduling and fan-out
    long getRefreshIntervalSeconds() const;
    void setRefreshIntervalSeconds(long seconds);
    long getRequestTimeoutSeconds() const;
    void setRequestTimeoutSeconds(long seconds);
    long getCycleTimeoutSeconds() const;
    void setCycleTimeoutSeconds(long seconds);
    int getMaxConcurrentFetches() const;
    void setMaxConcurrentFetches(int count);

    // Uses the default path unless setConfigPath() was called
    void save();
    void load();
    bool loadFromFile(const std::string& path);
    bool saveToFile(const std::string& path) const;

    std::string getConfigPath() const;
    void setConfigPath(const std::string& path);
    void resetToDefaults();

private:
    Config();
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    enum class LoadStatus { Loaded, Unreadable, NotAnObject };

    LoadStatus readFile(const std::string& path);
    std::string defaultConfigPath() const;
    void ensureDefaults();

    std::string configPath_;
    std::vector<std::string> subreddits_;
    std::string baseUrl_;
    std::string timeWindow_;
    int itemLimit_;
    std::string userAgent_;
    long refreshIntervalSeconds_;
    long requestTimeoutSeconds_;
    long cycleTimeoutSeconds_;
    int maxConcurrentFetches_;
};

}
