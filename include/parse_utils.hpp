#pragma once

#include "errors.hpp"

#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace parseutil {

inline std::string trimCopy(std::string_view s) {
    size_t start = 0;
    while (start < s.size() &&
           std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    size_t end = s.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

inline std::string lowerCopy(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

inline double parseDoubleStrict(const std::string& raw_value, const std::string& context) {
    const std::string value = trimCopy(raw_value);
    if (value.empty()) {
        throw ValidationError("Invalid value for " + context + ": expected number, got empty");
    }
    size_t idx = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &idx);
    } catch (const std::exception&) {
        idx = 0;
    }
    if (idx == 0 || idx != value.size()) {
        throw ValidationError("Invalid value for " + context +
                              ": expected number, got '" + raw_value + "'");
    }
    return parsed;
}

inline int parseIntStrict(const std::string& raw_value, const std::string& context) {
    const std::string value = trimCopy(raw_value);
    if (value.empty()) {
        throw ValidationError("Invalid value for " + context + ": expected integer, got empty");
    }
    size_t idx = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &idx);
    } catch (const std::exception&) {
        idx = 0;
    }
    if (idx == 0 || idx != value.size()) {
        throw ValidationError("Invalid value for " + context +
                              ": expected integer, got '" + raw_value + "'");
    }
    return parsed;
}

inline bool parseBoolStrict(const std::string& raw_value, const std::string& context) {
    const std::string value = lowerCopy(trimCopy(raw_value));
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ValidationError("Invalid value for " + context +
                          ": expected bool, got '" + raw_value + "'");
}

// Split "[a, b, c]" or "a, b, c" into trimmed, non-empty tokens
inline std::vector<std::string> splitListStrict(const std::string& raw_value,
                                                const std::string& context) {
    std::string value = trimCopy(raw_value);
    if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
        value = trimCopy(std::string_view(value).substr(1, value.size() - 2));
    }
    if (value.empty()) {
        throw ValidationError("Invalid value for " + context +
                              ": expected comma-separated list, got empty");
    }

    std::vector<std::string> tokens;
    std::stringstream ss(value);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trimCopy(token);
        if (token.empty()) {
            throw ValidationError("Invalid value for " + context +
                                  ": empty token at position " + std::to_string(tokens.size()));
        }
        tokens.push_back(token);
    }
    if (value.back() == ',') {
        throw ValidationError("Invalid value for " + context + ": trailing comma");
    }
    return tokens;
}

inline std::vector<double> parseDoubleListStrict(const std::string& raw_value,
                                                 const std::string& context) {
    std::vector<double> values;
    for (const auto& token : splitListStrict(raw_value, context)) {
        values.push_back(parseDoubleStrict(token, context));
    }
    return values;
}

inline std::vector<int> parseIntListStrict(const std::string& raw_value,
                                           const std::string& context) {
    std::vector<int> values;
    for (const auto& token : splitListStrict(raw_value, context)) {
        values.push_back(parseIntStrict(token, context));
    }
    return values;
}

}  // namespace parseutil
