#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <string>

namespace util
{

using WallClock   = std::function<std::chrono::system_clock::time_point()>;
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

inline std::chrono::system_clock::time_point wall_now()
{
    return std::chrono::system_clock::now();
}

inline std::chrono::steady_clock::time_point steady_now()
{
    return std::chrono::steady_clock::now();
}

// 2026-10-19T18:52:07.123Z
inline std::string iso8601(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    const auto  ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(tp);
    std::tm     tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
    return buf;
}

}  // namespace util
