#pragma once
#include <string>

namespace RedditDash {

class CancellationFlag;

class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient();

    struct Response {
        int statusCode;
        std::string body;
        bool success;
        bool cancelled;
        std::string error;
    };

    // statusCode stays 0 when the transfer never produced an HTTP response.
    virtual Response get(const std::string& url, const CancellationFlag* cancel = nullptr);

    void setUserAgent(const std::string& userAgent);
    void setTimeout(long timeoutSeconds);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    std::string userAgent_;
    long timeout_;
};

}
