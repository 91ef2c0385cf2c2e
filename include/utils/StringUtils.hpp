#pragma once
#include <string>
#include <vector>

namespace FeedLine {

namespace StringUtils {

// Drops invalid UTF-8 sequences and control code points other than tab/LF/CR
std::string sanitizeUtf8(const std::string& input);

std::string toLower(const std::string& s);
std::string trim(const std::string& s);
bool startsWith(const std::string& s, const std::string& prefix);
bool endsWith(const std::string& s, const std::string& suffix);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);
std::string replaceAll(std::string s, const std::string& from, const std::string& to);
std::vector<std::string> split(const std::string& s, char delim);

// Shortens long values for log output
std::string truncateForLog(const std::string& s, size_t max = 80);

}

}
