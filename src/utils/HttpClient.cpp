#include "utils/HttpClient.hpp"
#include "utils/StringUtils.hpp"
#include <curl/curl.h>

namespace FeedLine {

RequestOptions& RequestOptions::withBrowserHeaders() {
    userAgent = HttpClient::kBrowserUserAgent;
    headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/*;q=0.8";
    headers["Accept-Language"] = "en-US,en;q=0.5";
    return *this;
}

RequestOptions& RequestOptions::withImageHeaders() {
    userAgent = HttpClient::kBrowserUserAgent;
    headers["Accept"] = "image/webp,image/png,image/jpeg,image/*;q=0.8";
    return *this;
}

RequestOptions& RequestOptions::withTimeout(long seconds) {
    timeoutSeconds = seconds;
    return *this;
}

HttpClient::HttpClient()
    : userAgent_(kDefaultUserAgent), timeout_(15) {
    curl_global_init(CURL_GLOBAL_ALL);
}

HttpClient::~HttpClient() { curl_global_cleanup(); }

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t HttpClient::writeBytesCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* vec = static_cast<std::vector<unsigned char>*>(userp);
    auto* data = static_cast<unsigned char*>(contents);
    vec->insert(vec->end(), data, data + size * nmemb);
    return size * nmemb;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string header(buffer, size * nitems);
    size_t pos = header.find(':');
    if (pos != std::string::npos) {
        std::string key = StringUtils::toLower(header.substr(0, pos));
        std::string val = header.substr(pos + 1);
        val.erase(0, val.find_first_not_of(" \t"));
        val.erase(val.find_last_not_of(" \t\r\n") + 1);
        (*headers)[key] = val;
    }
    return size * nitems;
}

// Applies the options shared by text and byte requests; returns the header list the caller frees
static curl_slist* applyOptions(CURL* curl, const std::string& url, const RequestOptions& options,
                                const std::string& defaultAgent, long defaultTimeout) {
    const std::string& agent = options.userAgent.empty() ? defaultAgent : options.userAgent;
    long timeout = options.timeoutSeconds > 0 ? options.timeoutSeconds : defaultTimeout;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");

    curl_slist* list = nullptr;
    for (const auto& h : options.headers) {
        std::string line = h.first + ": " + h.second;
        list = curl_slist_append(list, line.c_str());
    }
    if (list) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    return list;
}

Response HttpClient::fetchSync(const std::string& url, const RequestOptions& options) {
    Response response;
    CURL* curl = curl_easy_init();
    if (!curl) { response.error = "CURL init failed"; return response; }

    curl_slist* headers = applyOptions(curl, url, options, userAgent_, timeout_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.success = (httpCode >= 200 && httpCode < 300);
        // file:// and similar schemes report no status
        if (httpCode == 0 && !StringUtils::startsWith(url, "http")) {
            response.statusCode = 200;
            response.success = true;
        }
    } else {
        response.body.clear();
        response.error = curl_easy_strerror(res);
        response.dnsFailure = (res == CURLE_COULDNT_RESOLVE_HOST || res == CURLE_COULDNT_RESOLVE_PROXY);
    }
    if (headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}

std::vector<unsigned char> HttpClient::fetchBytes(const std::string& url, const RequestOptions& options) {
    std::vector<unsigned char> data;
    CURL* curl = curl_easy_init();
    if (!curl) return data;

    curl_slist* headers = applyOptions(curl, url, options, userAgent_, timeout_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBytesCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &data);

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    if (res != CURLE_OK || httpCode >= 400) {
        data.clear();
    }
    if (headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return data;
}

void HttpClient::setUserAgent(const std::string& ua) { userAgent_ = ua; }
void HttpClient::setTimeout(long t) { timeout_ = t; }

}
