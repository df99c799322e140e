#include "time_utils.hpp"
#include <cstdio>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_elapsed(std::chrono::milliseconds dur) {
    long long ms = dur.count();
    if (ms < 0)
        ms = 0;
    char buf[32];
    if (ms < 1000) {
        std::snprintf(buf, sizeof(buf), "%lldms", ms);
    } else if (ms < 60 * 1000) {
        std::snprintf(buf, sizeof(buf), "%lld.%llds", ms / 1000, (ms % 1000) / 100);
    } else if (ms < 3600 * 1000) {
        long long s = ms / 1000;
        std::snprintf(buf, sizeof(buf), "%lldm%02llds", s / 60, s % 60);
    } else {
        long long m = ms / 60000;
        std::snprintf(buf, sizeof(buf), "%lldh%02lldm", m / 60, m % 60);
    }
    return buf;
}
