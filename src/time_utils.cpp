#include "time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

std::string timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local) == 0)
        return {};
    return buf;
}

std::string format_duration_short(std::chrono::seconds dur) {
    struct Unit {
        long long seconds;
        char tag;
    };
    static const Unit units[] = {{86400, 'd'}, {3600, 'h'}, {60, 'm'}};
    long long rest = dur.count() < 0 ? 0 : dur.count();
    std::string out;
    for (const Unit& u : units) {
        const long long n = rest / u.seconds;
        rest %= u.seconds;
        // Once a larger unit is printed, smaller ones are kept even when zero.
        if (n > 0 || !out.empty())
            out += std::to_string(n) + u.tag;
    }
    return out + std::to_string(rest) + 's';
}

std::string format_elapsed(std::chrono::milliseconds dur) {
    const long long ms = dur.count();
    if (ms < 1000)
        return std::to_string(ms) + "ms";
    if (ms >= 60 * 1000)
        return format_duration_short(std::chrono::duration_cast<std::chrono::seconds>(dur));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fs", static_cast<double>(ms) / 1000.0);
    return buf;
}
