#include "utils.hpp"
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>

static std::tm local_tm(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm); // thread-safe
    return tm;
}

std::string now_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const long ms = static_cast<long>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tm = local_tm(system_clock::to_time_t(now));
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return std::string();
    char out[80];
    std::snprintf(out, sizeof(out), "%s.%03ld", buf, ms);
    return std::string(out);
}

std::string now_timestamp_filename() {
    std::tm tm = local_tm(std::time(nullptr));
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
    return oss.str();
}

double wall_clock_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

double steady_clock_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}
