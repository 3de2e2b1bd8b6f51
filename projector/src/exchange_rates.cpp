#include "exchange_rates.hpp"
#include "util.hpp"
#include <cmath>

ExchangeRateTable::ExchangeRateTable(std::map<std::string, double> rates,
                                     std::map<std::string, std::string> symbols) {
    for (const auto& [code, value] : rates) {
        rates_[util::to_upper(code)] = value;
    }
    for (const auto& [code, sym] : symbols) {
        symbols_[util::to_upper(code)] = sym;
    }
}

ExchangeRateTable ExchangeRateTable::defaults() {
    return ExchangeRateTable(
        {
            {"USD", 1.0},
            {"EUR", 0.92},
            {"GBP", 0.79},
            {"JPY", 149.50},
            {"AUD", 1.55}
        },
        {
            {"USD", "$"},
            {"EUR", "€"},
            {"GBP", "£"},
            {"JPY", "¥"},
            {"AUD", "A$"}
        });
}

double ExchangeRateTable::rate(const std::string& currency) const {
    std::string code = util::to_upper(currency);
    if (code == "USD") {
        return 1.0;
    }

    auto it = rates_.find(code);
    if (it == rates_.end() || !std::isfinite(it->second) || it->second <= 0.0) {
        return 1.0;
    }
    return it->second;
}

std::string ExchangeRateTable::symbol(const std::string& currency) const {
    auto it = symbols_.find(util::to_upper(currency));
    return it != symbols_.end() ? it->second : "$";
}

bool ExchangeRateTable::contains(const std::string& currency) const {
    return rates_.count(util::to_upper(currency)) > 0;
}

std::vector<std::string> ExchangeRateTable::currencies() const {
    std::vector<std::string> codes;
    for (const auto& entry : rates_) {
        codes.push_back(entry.first);
    }
    return codes;
}

nlohmann::json ExchangeRateTable::to_json() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [code, value] : rates_) {
        out[code] = {
            {"rate", value},
            {"symbol", symbol(code)}
        };
    }
    return out;
}
