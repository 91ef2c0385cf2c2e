#pragma once
#include <mutex>
#include <string>
#include <vector>

namespace FeedLine {

// Plain-text list of local news feed URLs, one per line
class LocalFeedList {
public:
    explicit LocalFeedList(std::string path);

    // Trimmed, non-empty lines in file order; empty when the file is missing
    std::vector<std::string> readUrls();
    // Removes every line equal to url; returns whether the file changed
    bool prune(const std::string& url);
    bool append(const std::string& url);

    const std::string& path() const { return path_; }

private:
    std::vector<std::string> readLinesLocked(bool& exists);
    bool writeLinesLocked(const std::vector<std::string>& lines);

    std::string path_;
    std::mutex mutex_;
};

}
