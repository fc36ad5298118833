#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace lungrisk::features {

// One loosely typed field as supplied by a caller; std::monostate means absent/null
using RawValue = std::variant<std::monostate, bool, double, std::string>;

// Unordered request attributes, keyed by feature name
using RawAttributeSet = std::map<std::string, RawValue>;

// Human labels for the two values of a binary feature, e.g. {"male", "female"}
struct BinaryMeaning {
    std::string positive{"yes"};
    std::string negative{"no"};
};

inline std::string trimLower(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string out;
    if (first < last) out.assign(first, last);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Whole-string finite decimal parse; nullopt on trailing garbage, hex, overflow, nan or inf
inline std::optional<double> parseDecimal(const std::string& text) {
    const std::string s = trimLower(text);
    if (s.empty() || s.find('x') != std::string::npos) return std::nullopt;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(v)) return std::nullopt;
    return v;
}

inline double parseNumeric(const RawValue& value, double fallback = 0.0) {
    if (const auto* b = std::get_if<bool>(&value)) return *b ? 1.0 : 0.0;
    if (const auto* d = std::get_if<double>(&value)) return std::isfinite(*d) ? *d : fallback;
    if (const auto* s = std::get_if<std::string>(&value)) return parseDecimal(*s).value_or(fallback);
    return fallback;
}

// Tolerant yes/no parser. Unknown or absent input resolves to 0.
inline int parseBinary(const RawValue& value, const BinaryMeaning* meaning = nullptr) {
    if (const auto* b = std::get_if<bool>(&value)) return *b ? 1 : 0;
    if (const auto* d = std::get_if<double>(&value)) return (*d >= 0.5) ? 1 : 0;
    const auto* s = std::get_if<std::string>(&value);
    if (s == nullptr) return 0;

    const std::string t = trimLower(*s);
    if (t == "yes" || t == "y" || t == "true" || t == "t") return 1;
    if (t == "no" || t == "n" || t == "false" || t == "f") return 0;
    if (auto d = parseDecimal(t)) return (*d >= 0.5) ? 1 : 0;
    if (meaning != nullptr) {
        if (t == trimLower(meaning->positive)) return 1;
        if (t == trimLower(meaning->negative)) return 0;
    }
    return 0;
}

} // namespace lungrisk::features
