#include "services/LocalFeedList.hpp"
#include "utils/StringUtils.hpp"
#include <glib.h>
#include <glib/gstdio.h>

namespace FeedLine {

LocalFeedList::LocalFeedList(std::string path) : path_(std::move(path)) {}

std::vector<std::string> LocalFeedList::readLinesLocked(bool& exists) {
    std::vector<std::string> lines;
    exists = false;
    gchar* contents = nullptr;
    gsize length = 0;
    GError* error = nullptr;
    if (!g_file_get_contents(path_.c_str(), &contents, &length, &error)) {
        if (error && !g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT)) {
            g_warning("failed to read local feed list %s: %s", path_.c_str(), error->message);
        }
        if (error) g_error_free(error);
        return lines;
    }
    exists = true;
    std::string text(contents, length);
    g_free(contents);

    for (const auto& line : StringUtils::split(text, '\n')) {
        std::string trimmed = StringUtils::trim(line);
        if (!trimmed.empty()) lines.push_back(trimmed);
    }
    return lines;
}

bool LocalFeedList::writeLinesLocked(const std::vector<std::string>& lines) {
    std::string text;
    for (const auto& line : lines) text += line + "\n";

    gchar* dir = g_path_get_dirname(path_.c_str());
    g_mkdir_with_parents(dir, 0755);
    g_free(dir);

    GError* error = nullptr;
    if (!g_file_set_contents(path_.c_str(), text.c_str(), static_cast<gssize>(text.size()), &error)) {
        g_warning("failed to write local feed list %s: %s", path_.c_str(), error ? error->message : "unknown");
        if (error) g_error_free(error);
        return false;
    }
    return true;
}

std::vector<std::string> LocalFeedList::readUrls() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool exists = false;
    return readLinesLocked(exists);
}

bool LocalFeedList::prune(const std::string& url) {
    std::string target = StringUtils::trim(url);
    if (target.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    bool exists = false;
    std::vector<std::string> lines = readLinesLocked(exists);
    if (!exists) return false;

    std::vector<std::string> kept;
    for (const auto& line : lines) {
        if (line != target) kept.push_back(line);
    }
    if (kept.size() == lines.size()) return false;

    g_message("pruning unreachable local feed %s", target.c_str());
    return writeLinesLocked(kept);
}

bool LocalFeedList::append(const std::string& url) {
    std::string value = StringUtils::trim(url);
    if (value.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    bool exists = false;
    std::vector<std::string> lines = readLinesLocked(exists);
    for (const auto& line : lines) {
        if (line == value) return false;
    }
    lines.push_back(value);
    return writeLinesLocked(lines);
}

}
