#include "Utils/StringUtils.h"

#include <stdexcept>

namespace StringUtils {

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> Split(const std::string& s, char delim, bool keepEmpty) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream iss(s);
    while (std::getline(iss, token, delim)) {
        if (token.empty() && !keepEmpty) continue;
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> SplitList(const std::string& s, char delim) {
    std::vector<std::string> out;
    for (auto& token : Split(s, delim)) {
        std::string t = Trim(token);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

std::string ToLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string ToUpper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return out;
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return ToLower(a) == ToLower(b);
}

std::optional<int> ToInt(const std::string& s) {
    try {
        size_t idx = 0;
        int v = std::stoi(s, &idx);
        if (idx != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> ToDouble(const std::string& s) {
    try {
        size_t idx = 0;
        double v = std::stod(s, &idx);
        if (idx != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> ToBool(const std::string& s) {
    std::string v = ToLower(Trim(s));
    if (v == "true" || v == "yes" || v == "on" || v == "1")  return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

std::string ToHex(const unsigned char* data, size_t len) {
    static const char* hexDigits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(hexDigits[data[i] >> 4]);
        out.push_back(hexDigits[data[i] & 0xF]);
    }
    return out;
}

}
