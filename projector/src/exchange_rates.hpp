#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

// Immutable snapshot of USD-relative rates and display symbols.
// A fetch produces a new table; a table is never updated in place.
class ExchangeRateTable {
public:
    ExchangeRateTable() = default;
    ExchangeRateTable(std::map<std::string, double> rates,
                      std::map<std::string, std::string> symbols);

    static ExchangeRateTable defaults();

    // Falls back to 1.0 for unknown or unusable rates; USD is always 1.0
    double rate(const std::string& currency) const;
    // Falls back to "$"
    std::string symbol(const std::string& currency) const;
    bool contains(const std::string& currency) const;
    std::vector<std::string> currencies() const;

    nlohmann::json to_json() const;

private:
    std::map<std::string, double> rates_;
    std::map<std::string, std::string> symbols_;
};
