#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();

    // Half away from zero, so round_to(round_to(x, n), n) == round_to(x, n)
    double round_to(double value, int decimals);
    double round_cents(double value);

    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_upper(const std::string& str);

    // Accepts "1,367.5" style input; rejects empty, partial and non-finite text
    std::optional<double> parse_number(const std::string& text);

    // 1234567.891 -> "1,234,567.89"
    std::string format_grouped(double value, int decimals = 2);
}
