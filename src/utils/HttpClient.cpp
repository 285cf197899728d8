#include "utils/HttpClient.hpp"
#include "utils/CancellationFlag.hpp"
#include <curl/curl.h>

namespace RedditDash {

HttpClient::HttpClient()
    : userAgent_("linux:redditdash:1.0 (by /u/redditdash)"), timeout_(30) {
    curl_global_init(CURL_GLOBAL_ALL);
}

HttpClient::~HttpClient() { curl_global_cleanup(); }

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Non-zero return makes curl abort the transfer with CURLE_ABORTED_BY_CALLBACK
static int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<const CancellationFlag*>(clientp);
    return (cancel && cancel->isCancelled()) ? 1 : 0;
}

HttpClient::Response HttpClient::get(const std::string& url, const CancellationFlag* cancel) {
    Response response{0, "", false, false, ""};
    if (cancel && cancel->isCancelled()) {
        response.cancelled = true;
        response.error = "cancelled before request";
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) { response.error = "CURL init failed"; return response; }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (cancel) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, cancel);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        long httpCode;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.success = (httpCode >= 200 && httpCode < 300);
    } else {
        response.cancelled = (res == CURLE_ABORTED_BY_CALLBACK);
        response.error = curl_easy_strerror(res);
    }
    curl_easy_cleanup(curl);
    return response;
}

void HttpClient::setUserAgent(const std::string& ua) { userAgent_ = ua; }
void HttpClient::setTimeout(long t) { timeout_ = t; }

}
