#pragma once
#include "utils/HttpFetcher.hpp"
#include <string>
#include <map>
#include <vector>

namespace FeedLine {

class HttpClient : public HttpFetcher {
public:
    static constexpr const char* kDefaultUserAgent = "feedline/1.0";
    static constexpr const char* kBrowserUserAgent =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

    HttpClient();
    ~HttpClient() override;

    Response fetchSync(const std::string& url, const RequestOptions& options) override;
    std::vector<unsigned char> fetchBytes(const std::string& url, const RequestOptions& options) override;
    void setUserAgent(const std::string& userAgent);
    void setTimeout(long timeoutSeconds);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t writeBytesCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
    std::string userAgent_;
    long timeout_;
};

}
