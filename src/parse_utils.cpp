#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>
#include <utility>

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(value);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (v < min || v > max)
        return 0;
    ok = true;
    return static_cast<size_t>(v);
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    if (val.empty())
        return 0;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    unsigned long long mult = 1;
    static const std::pair<const char*, unsigned long long> units[] = {
        {"kb", 1024ull},
        {"mb", 1024ull * 1024},
        {"gb", 1024ull * 1024 * 1024},
        {"tb", 1024ull * 1024 * 1024 * 1024},
        {"k", 1024ull},
        {"m", 1024ull * 1024},
        {"g", 1024ull * 1024 * 1024},
        {"t", 1024ull * 1024 * 1024 * 1024},
        {"b", 1ull}};
    for (const auto& u : units) {
        if (ends_with(u.first)) {
            mult = u.second;
            val.erase(val.size() - std::char_traits<char>::length(u.first));
            break;
        }
    }
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::out_of_range&) {
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

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    char unit = value.back();
    std::string num = value;
    if (unit == 's' || unit == 'm' || unit == 'h' || unit == 'd')
        num.pop_back();
    else if (std::isdigit(static_cast<unsigned char>(unit)))
        unit = 's';
    else
        return std::chrono::seconds(0);
    if (!all_digits(num))
        return std::chrono::seconds(0);
    long long n = 0;
    try {
        n = std::stoll(num);
    } catch (const std::out_of_range&) {
        return std::chrono::seconds(0);
    }
    ok = true;
    switch (unit) {
    case 'm':
        return std::chrono::minutes(n);
    case 'h':
        return std::chrono::hours(n);
    case 'd':
        return std::chrono::hours(24 * n);
    default:
        return std::chrono::seconds(n);
    }
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    std::string v = lower(value);
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
