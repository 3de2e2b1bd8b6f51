#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <chrono>
#include <cctype>
#include <cmath>
#include <fmt/format.h>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Half away from zero: exact binary ties such as 0.125 round up to 0.13,
// not half-to-even
double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double round_cents(double value) {
    return round_to(value, 2);
}

std::string trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) start++;

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) end--;

    return std::string(start, end);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::optional<double> parse_number(const std::string& text) {
    std::string cleaned;
    for (char c : trim(text)) {
        if (c != ',') cleaned += c;
    }
    if (cleaned.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        double value = std::stod(cleaned, &consumed);
        if (consumed != cleaned.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_grouped(double value, int decimals) {
    std::string plain = fmt::format("{:.{}f}", std::fabs(value), decimals);

    auto dot = plain.find('.');
    std::string whole = dot == std::string::npos ? plain : plain.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : plain.substr(dot);

    std::string grouped;
    int count = 0;
    for (auto it = whole.rbegin(); it != whole.rend(); ++it) {
        if (count > 0 && count % 3 == 0) grouped += ',';
        grouped += *it;
        count++;
    }
    std::reverse(grouped.begin(), grouped.end());

    bool negative = value < 0 && plain.find_first_not_of("0.") != std::string::npos;
    return (negative ? "-" : "") + grouped + frac;
}

} // namespace util
