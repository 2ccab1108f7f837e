#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

inline bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Splits on `delimiter`, trimming spaces and dropping empty pieces
inline std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(delimiter, start);
        if (end == std::string::npos) end = s.size();
        std::string piece = s.substr(start, end - start);
        size_t first = piece.find_first_not_of(' ');
        size_t last = piece.find_last_not_of(' ');
        if (first != std::string::npos) {
            parts.push_back(piece.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return parts;
}

}  // namespace StringUtils
