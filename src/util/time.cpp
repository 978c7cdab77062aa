// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <util/time.h>

#include <cstdio>

std::string FormatISO8601DateTime(int64_t nTime) {
    time_t time_val = static_cast<time_t>(nTime);
    struct tm ts{};
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04i-%02i-%02iT%02i:%02i:%02iZ",
             ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday,
             ts.tm_hour, ts.tm_min, ts.tm_sec);
    return std::string(buffer);
}

bool ParseISO8601DateTime(const std::string& str, int64_t& nTime) {
    int year, month, day, hour, minute, second;
    char trailer = 0;
    if (str.size() != 20 ||
        sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%c",
               &year, &month, &day, &hour, &minute, &second, &trailer) != 7 ||
        trailer != 'Z') {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    struct tm ts{};
    ts.tm_year = year - 1900;
    ts.tm_mon = month - 1;
    ts.tm_mday = day;
    ts.tm_hour = hour;
    ts.tm_min = minute;
    ts.tm_sec = second;
    nTime = static_cast<int64_t>(timegm(&ts));
    return true;
}
