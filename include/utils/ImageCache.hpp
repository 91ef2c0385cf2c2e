#pragma once
#include "utils/LruCache.hpp"
#include "utils/HttpFetcher.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace FeedLine {

using ImageBytes = std::shared_ptr<const std::vector<unsigned char>>;

// In-memory image bytes keyed by URL, shared between the UI and workers
class ImageCache {
public:
    explicit ImageCache(size_t capacity = 12);

    ImageBytes get(const std::string& url);
    void put(const std::string& url, ImageBytes bytes);
    // Returns cached bytes or fetches them; null when the fetch yields nothing
    ImageBytes load(const std::string& url, HttpFetcher& fetcher);

    void setCapacity(size_t capacity);
    size_t capacity() const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    LruCache<std::string, ImageBytes> cache_;
};

}
