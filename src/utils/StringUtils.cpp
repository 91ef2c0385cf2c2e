#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace FeedLine {

namespace StringUtils {

// Number of continuation bytes a lead byte announces, or -1 for an invalid lead
static int sequenceLength(unsigned char c) {
    if (c < 0x80) return 0;
    if ((c & 0xE0) == 0xC0) return 1;
    if ((c & 0xF0) == 0xE0) return 2;
    if ((c & 0xF8) == 0xF0) return 3;
    return -1;
}

std::string sanitizeUtf8(const std::string& input) {
    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    const size_t n = input.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        int extra = sequenceLength(c);
        if (extra < 0 || i + extra >= n) {
            i++; // Skip invalid lead or truncated sequence
            continue;
        }
        if (extra == 0) {
            // Only tab, LF and CR survive below 0x20; DEL is dropped too
            if (c >= 0x20 ? c != 0x7F : (c == 0x09 || c == 0x0A || c == 0x0D)) {
                result += static_cast<char>(c);
            }
            i++;
            continue;
        }

        bool valid = true;
        unsigned long cp = c & (0x3F >> extra);
        for (int k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(input[i + k]);
            if ((cc & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            i++;
            continue;
        }

        // Reject overlong forms, surrogates, out-of-range values and C1 controls
        static const unsigned long minForLength[] = {0, 0x80, 0x800, 0x10000};
        if (cp < minForLength[extra] || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF) || (cp >= 0x80 && cp <= 0x9F) ||
            cp == 0xFFFE || cp == 0xFFFF) {
            i += extra + 1;
            continue;
        }
        result.append(input, i, extra + 1);
        i += extra + 1;
    }
    return result;
}

std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::string replaceAll(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string truncateForLog(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    return s.substr(0, max) + "...";
}

}

}
