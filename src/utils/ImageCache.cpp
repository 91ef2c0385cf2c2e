#include "utils/ImageCache.hpp"
#include "utils/StringUtils.hpp"
#include <glib.h>

namespace FeedLine {

ImageCache::ImageCache(size_t capacity) : cache_(capacity) {}

ImageBytes ImageCache::get(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    ImageBytes bytes;
    cache_.get(url, bytes);
    return bytes;
}

void ImageCache::put(const std::string& url, ImageBytes bytes) {
    if (!bytes) return;
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.put(url, std::move(bytes));
}

ImageBytes ImageCache::load(const std::string& url, HttpFetcher& fetcher) {
    if (url.empty()) return nullptr;
    if (ImageBytes cached = get(url)) return cached;

    // Fetch outside the lock; concurrent misses on one URL both download
    RequestOptions options;
    options.withImageHeaders();
    std::vector<unsigned char> data = fetcher.fetchBytes(url, options);
    if (data.empty()) {
        g_debug("image fetch returned nothing: %s", StringUtils::truncateForLog(url).c_str());
        return nullptr;
    }
    auto bytes = std::make_shared<const std::vector<unsigned char>>(std::move(data));
    put(url, bytes);
    return bytes;
}

void ImageCache::setCapacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.setCapacity(capacity);
}

size_t ImageCache::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.capacity();
}

size_t ImageCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void ImageCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

}
