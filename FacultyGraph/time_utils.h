#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <functional>

using namespace std;

typedef chrono::system_clock::time_point TimePoint;
typedef function<TimePoint()> ClockFn;

inline ClockFn systemClock() {
    return []() { return chrono::system_clock::now(); };
}

// ISO-8601 UTC, second precision: 2024-05-01T12:00:00Z
inline string formatTimestamp(TimePoint tp) {
    time_t t = chrono::system_clock::to_time_t(tp);
    tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return string(buf);
}

// Compact form used in export file names: 20240501_120000
inline string fileTimestamp(TimePoint tp) {
    time_t t = chrono::system_clock::to_time_t(tp);
    tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &utc);
    return string(buf);
}

// Inverse of formatTimestamp. Returns false on malformed input.
inline bool parseTimestamp(const string& s, TimePoint& out) {
    tm utc{};
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d", &y, &mo, &d, &h, &mi, &sec) != 6) return false;
    utc.tm_year = y - 1900;
    utc.tm_mon = mo - 1;
    utc.tm_mday = d;
    utc.tm_hour = h;
    utc.tm_min = mi;
    utc.tm_sec = sec;
    out = chrono::system_clock::from_time_t(timegm(&utc));
    return true;
}

inline double ageInDays(TimePoint then, TimePoint now) {
    return chrono::duration<double>(now - then).count() / 86400.0;
}
