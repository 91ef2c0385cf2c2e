#pragma once
#include <mutex>
#include <string>
#include <vector>

namespace FeedLine {

struct FeedSource {
    std::string name;
    std::string url;
    std::string faviconUrl;
};

// User-added feed sources ("My Feed")
class FeedMetadataStore {
public:
    virtual ~FeedMetadataStore() = default;
    virtual std::vector<FeedSource> findAll() = 0;
    virtual bool findByUrl(const std::string& url, FeedSource& out) = 0;
    virtual bool updateFaviconUrl(const std::string& url, const std::string& faviconUrl) = 0;
    // Replaces an existing entry with the same URL
    virtual bool add(const FeedSource& source) = 0;
};

// Sources persisted as a JSON array of {name, url, faviconUrl}
class JsonFeedMetadataStore : public FeedMetadataStore {
public:
    explicit JsonFeedMetadataStore(std::string path);

    std::vector<FeedSource> findAll() override;
    bool findByUrl(const std::string& url, FeedSource& out) override;
    bool updateFaviconUrl(const std::string& url, const std::string& faviconUrl) override;
    bool add(const FeedSource& source) override;

    const std::string& path() const { return path_; }

private:
    std::vector<FeedSource> readLocked() const;
    bool writeLocked(const std::vector<FeedSource>& sources) const;

    std::string path_;
    std::mutex mutex_;
};

}
