#include "dirgen.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace dirgen {

std::string format_iso_time(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string generate_id(const std::string& prefix) {
    static std::mutex gen_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static const char* hex = "0123456789abcdef";

    std::lock_guard<std::mutex> lock(gen_mutex);
    std::string id = prefix;
    for (int i = 0; i < 32; i++) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            id += '-';
        }
        if (i == 12) {
            id += '4';
        } else if (i == 16) {
            id += hex[8 + (dis(gen) & 0x3)];
        } else {
            id += hex[dis(gen)];
        }
    }
    return id;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string truncate(const std::string& s, size_t max_len) {
    if (s.length() <= max_len) {
        return s;
    }
    return s.substr(0, max_len) + "...";
}

} // namespace dirgen
