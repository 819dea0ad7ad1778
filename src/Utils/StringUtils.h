#pragma once

#include <string>
#include <vector>
#include <optional>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace StringUtils {

    // Trim whitespace from start and end
    std::string Trim(const std::string& s);

    // Split string by delimiter (single char), include empty tokens if requested
    std::vector<std::string> Split(const std::string& s, char delim, bool keepEmpty = false);

    // Split and trim each token, dropping empties ("a, b ,c" -> {a,b,c})
    std::vector<std::string> SplitList(const std::string& s, char delim = ',');

    std::string ToLower(const std::string& s);
    std::string ToUpper(const std::string& s);

    bool EqualsIgnoreCase(const std::string& a, const std::string& b);

    // Parse whole string; returns nullopt on trailing garbage or overflow
    std::optional<int>    ToInt(const std::string& s);
    std::optional<double> ToDouble(const std::string& s);

    // true/false, yes/no, on/off, 1/0 (case-insensitive)
    std::optional<bool>   ToBool(const std::string& s);

    // Lowercase hex encoding of raw bytes
    std::string ToHex(const unsigned char* data, size_t len);
}
