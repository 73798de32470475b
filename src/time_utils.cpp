#include "time_utils.hpp"
#include <cstdio>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
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
    } else if (ms < 60000) {
        std::snprintf(buf, sizeof(buf), "%lld.%llds", ms / 1000, (ms % 1000) / 100);
    } else {
        long long s = ms / 1000;
        std::snprintf(buf, sizeof(buf), "%lldm%02llds", s / 60, s % 60);
    }
    return std::string(buf);
}
