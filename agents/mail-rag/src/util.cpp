#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

TimePoint epoch() {
    return TimePoint{};
}

std::string format_iso8601(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

static bool read_digits(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (!std::isdigit((unsigned char)c)) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += n;
    return true;
}

static bool expect(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) { ++pos; return true; }
    return false;
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    std::string s = text;
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    size_t pos = 0;
    while (pos < s.size() && std::isspace((unsigned char)s[pos])) ++pos;

    int year, month, day, hour = 0, minute = 0, second = 0;
    if (!read_digits(s, pos, 4, year) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, month) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, day)) {
        return std::nullopt;
    }
    long offset_seconds = 0;
    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != ' ') return std::nullopt;
        ++pos;
        if (!read_digits(s, pos, 2, hour) || !expect(s, pos, ':') ||
            !read_digits(s, pos, 2, minute)) {
            return std::nullopt;
        }
        if (expect(s, pos, ':') && !read_digits(s, pos, 2, second)) return std::nullopt;
        if (expect(s, pos, '.')) {
            // fractional seconds are dropped
            size_t start = pos;
            while (pos < s.size() && std::isdigit((unsigned char)s[pos])) ++pos;
            if (pos == start) return std::nullopt;
        }
        if (pos < s.size()) {
            char sign = s[pos];
            if (sign == 'Z' || sign == 'z') {
                ++pos;
            } else if (sign == '+' || sign == '-') {
                ++pos;
                int oh = 0, om = 0;
                if (!read_digits(s, pos, 2, oh)) return std::nullopt;
                expect(s, pos, ':');
                if (!read_digits(s, pos, 2, om)) return std::nullopt;
                offset_seconds = (oh * 3600L + om * 60L) * (sign == '-' ? -1 : 1);
            } else {
                return std::nullopt;
            }
        }
        if (pos != s.size()) return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);
    return Clock::from_time_t(t - offset_seconds);
}

float l2_squared(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) throw std::invalid_argument("l2_squared: size mismatch");
    double acc = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = (double)a[i] - (double)b[i];
        acc += d * d;
    }
    return (float)acc;
}

float dot(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) throw std::invalid_argument("dot: size mismatch");
    double acc = 0.0;
    for (size_t i = 0; i < a.size(); ++i) acc += (double)a[i] * (double)b[i];
    return (float)acc;
}

void l2_normalize(std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v) norm += (double)x * (double)x;
    if (norm == 0.0) return;
    norm = std::sqrt(norm);
    for (auto& x : v) x = (float)(x / norm);
}

std::string encode_embedding(const std::vector<float>& v) {
    std::string out(v.size() * sizeof(float), '\0');
    if (!v.empty()) std::memcpy(&out[0], v.data(), out.size());
    return out;
}

std::vector<float> decode_embedding(const void* data, std::size_t bytes) {
    if (bytes % sizeof(float) != 0) {
        throw std::runtime_error("embedding blob of " + std::to_string(bytes) + " bytes is not a float32 array");
    }
    std::vector<float> vec(bytes / sizeof(float));
    if (bytes) std::memcpy(vec.data(), data, bytes);
    return vec;
}

std::string truncate_utf8(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t cut = max_bytes;
    // back off continuation bytes (10xxxxxx) so a code point is never split
    while (cut > 0 && ((unsigned char)text[cut] & 0xC0) == 0x80) --cut;
    return text.substr(0, cut);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}
