#include "core/timestamp.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace std::chrono;

/* ===================== Helpers ===================== */

static bool readDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size())
        return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += count;
    return true;
}

static bool expect(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

static bool validDate(int y, int m, int d) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (y < 1 || m < 1 || m > 12 || d < 1)
        return false;
    bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    int limit = days[m - 1] + ((m == 2 && leap) ? 1 : 0);
    return d <= limit;
}

static Timestamp fromUtcFields(int y, int mon, int d, int h, int min, int sec) {
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = min;
    tm.tm_sec = sec;
    return system_clock::from_time_t(timegm(&tm));
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

/* ===================== ISO-8601 ===================== */

std::optional<Timestamp> parseIsoTimestamp(const std::string& raw) {
    std::string s = trim(raw);
    size_t pos = 0;
    int y = 0, mon = 0, d = 0;

    if (!readDigits(s, pos, 4, y) || !expect(s, pos, '-') ||
        !readDigits(s, pos, 2, mon) || !expect(s, pos, '-') ||
        !readDigits(s, pos, 2, d))
        return std::nullopt;
    if (!validDate(y, mon, d))
        return std::nullopt;

    if (pos == s.size())
        return fromUtcFields(y, mon, d, 0, 0, 0);

    if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')
        return std::nullopt;
    ++pos;

    int h = 0, min = 0, sec = 0;
    if (!readDigits(s, pos, 2, h) || !expect(s, pos, ':') ||
        !readDigits(s, pos, 2, min))
        return std::nullopt;
    if (expect(s, pos, ':') && !readDigits(s, pos, 2, sec))
        return std::nullopt;
    if (h > 23 || min > 59 || sec > 59)
        return std::nullopt;

    microseconds frac{0};
    if (expect(s, pos, '.') || expect(s, pos, ',')) {
        size_t start = pos;
        long long scaled = 0;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 6) {
                scaled = scaled * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == start)
            return std::nullopt;
        while (digits < 6) {
            scaled *= 10;
            ++digits;
        }
        frac = microseconds(scaled);
    }

    int offsetMinutes = 0;
    if (pos < s.size()) {
        if (s[pos] == 'Z' || s[pos] == 'z') {
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            int sign = (s[pos] == '-') ? -1 : 1;
            ++pos;
            int oh = 0, om = 0;
            if (!readDigits(s, pos, 2, oh))
                return std::nullopt;
            expect(s, pos, ':');
            if (!readDigits(s, pos, 2, om))
                return std::nullopt;
            if (oh > 23 || om > 59)
                return std::nullopt;
            offsetMinutes = sign * (oh * 60 + om);
        }
    }
    if (pos != s.size())
        return std::nullopt;

    Timestamp ts = fromUtcFields(y, mon, d, h, min, sec);
    ts += duration_cast<system_clock::duration>(frac);
    ts -= minutes(offsetMinutes);
    return ts;
}

/* ===================== WHOIS dates ===================== */

static int monthFromName(const std::string& name) {
    static const char* MONTHS[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
    if (name.size() != 3)
        return 0;
    std::string lower;
    for (char c : name)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (int i = 0; i < 12; ++i)
        if (lower == MONTHS[i])
            return i + 1;
    return 0;
}

std::optional<Timestamp> parseWhoisTimestamp(const std::string& raw) {
    if (auto iso = parseIsoTimestamp(raw))
        return iso;

    std::string s = trim(raw);
    size_t pos = 0;
    int d = 0, y = 0;
    if (!readDigits(s, pos, 2, d) && !readDigits(s, pos, 1, d))
        return std::nullopt;
    if (!expect(s, pos, '-') || pos + 3 > s.size())
        return std::nullopt;
    int mon = monthFromName(s.substr(pos, 3));
    pos += 3;
    if (mon == 0 || !expect(s, pos, '-') || !readDigits(s, pos, 4, y))
        return std::nullopt;
    if (pos != s.size() || !validDate(y, mon, d))
        return std::nullopt;
    return fromUtcFields(y, mon, d, 0, 0, 0);
}

/* ===================== Certificate time ===================== */

std::optional<Timestamp> parseCertTimestamp(const std::string& raw) {
    std::string s = trim(raw);
    std::tm tm{};
    std::istringstream in(s);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, "%b %d %H:%M:%S %Y");
    if (in.fail())
        return std::nullopt;

    std::string zone;
    in >> zone;
    if (zone != "GMT" && zone != "UTC")
        return std::nullopt;
    std::string rest;
    if (in >> rest)
        return std::nullopt;

    if (!validDate(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday))
        return std::nullopt;
    return system_clock::from_time_t(timegm(&tm));
}

/* ===================== Formatting ===================== */

std::string formatIsoTimestamp(Timestamp ts) {
    std::time_t tt = system_clock::to_time_t(time_point_cast<seconds>(ts));
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm);
    return buf;
}

long long daysBetween(Timestamp from, Timestamp to) {
    auto secs = duration_cast<seconds>(to - from).count();
    constexpr long long DAY = 86400;
    long long q = secs / DAY;
    if (secs % DAY != 0 && secs < 0)
        --q;
    return q;
}
