#pragma once

#include "exchange_rates.hpp"
#include <string>
#include <optional>

struct SpotData {
    double price;                 // USD
    double circulating_supply;    // units, not billions
    double btc_market_cap;        // USD, 0 when unavailable
};

// Where spot prices and FX rates come from. Failures are reported as
// std::nullopt, never thrown.
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    virtual std::optional<SpotData> fetch_spot_data(const std::string& coin_id) = 0;
    // Rates for the currencies listed in supported
    virtual std::optional<ExchangeRateTable> fetch_exchange_rates(const ExchangeRateTable& supported) = 0;
};
