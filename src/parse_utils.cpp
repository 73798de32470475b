#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>

static bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = to_lower(value);
    unsigned long long mult = 1;
    auto strip = [&](const std::string& suf, unsigned long long m) {
        if (val.size() > suf.size() && val.compare(val.size() - suf.size(), suf.size(), suf) == 0) {
            val.erase(val.size() - suf.size());
            mult = m;
            return true;
        }
        return false;
    };
    strip("kb", 1024ull) || strip("mb", 1024ull * 1024) || strip("gb", 1024ull * 1024 * 1024) ||
        strip("k", 1024ull) || strip("m", 1024ull * 1024) || strip("g", 1024ull * 1024 * 1024) ||
        strip("b", 1);
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::exception&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

std::chrono::seconds parse_duration(const std::string& value, long long max_seconds, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    std::string num = value;
    long long mult = 1;
    char unit = num.back();
    if (unit == 's' || unit == 'm' || unit == 'h') {
        num.pop_back();
        mult = unit == 'h' ? 3600 : unit == 'm' ? 60 : 1;
    }
    if (!all_digits(num) || num.size() > 12)
        return std::chrono::seconds(0);
    long long n = std::stoll(num) * mult;
    if (n > max_seconds)
        return std::chrono::seconds(0);
    ok = true;
    return std::chrono::seconds(n);
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    std::string v = to_lower(value);
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
