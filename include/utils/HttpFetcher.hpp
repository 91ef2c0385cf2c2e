#pragma once
#include <string>
#include <map>
#include <vector>

namespace FeedLine {

struct RequestOptions {
    std::string userAgent;
    std::map<std::string, std::string> headers;
    long timeoutSeconds = 0; // 0 uses the client default

    RequestOptions& withBrowserHeaders();
    RequestOptions& withImageHeaders();
    RequestOptions& withTimeout(long seconds);
};

struct Response {
    int statusCode = 0;        // 0 means the request never got an HTTP status
    std::string body;
    std::map<std::string, std::string> headers;
    bool success = false;      // 2xx
    std::string error;         // transport error text when statusCode == 0
    bool dnsFailure = false;
};

class HttpFetcher {
public:
    virtual ~HttpFetcher() = default;
    virtual Response fetchSync(const std::string& url, const RequestOptions& options) = 0;
    virtual std::vector<unsigned char> fetchBytes(const std::string& url, const RequestOptions& options) = 0;
};

}
