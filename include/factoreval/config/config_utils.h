// include/factoreval/config/config_utils.h
#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace factoreval::config {

inline std::string trim_copy(const std::string& s) {
    size_t l = 0, r = s.size();
    while (l < r && std::isspace(static_cast<unsigned char>(s[l]))) ++l;
    while (r > l && std::isspace(static_cast<unsigned char>(s[r - 1]))) --r;
    return s.substr(l, r - l);
}

inline std::string to_lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

/// @brief 按分隔符切分并裁剪空白，空条目丢弃
///        允许用户在 INI 中写 “rolling_mean:5 , ema:0.3”。
inline std::vector<std::string> split_trimmed(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, sep)) {
        auto trimmed = trim_copy(token);
        if (!trimmed.empty()) parts.push_back(trimmed);
    }
    return parts;
}

} // namespace factoreval::config
