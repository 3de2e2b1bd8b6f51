#pragma once

#include "projection_types.hpp"
#include "exchange_rates.hpp"
#include <string>

constexpr double DEFAULT_TARGET_PORTFOLIO_USD = 1000000.0;

struct PortfolioMetrics {
    std::string currency;
    std::string symbol;
    double holdings;
    double current_price;              // display currency
    double portfolio_value;
    double market_cap;
    double price_needed_for_target;    // 0 when holdings <= 0
    double market_cap_needed_for_target;
    double btc_market_cap;
    double market_cap_ratio;           // USD over USD, 0 without BTC data
    bool btc_comparison_available;
    double target_usd;
};

class MetricsCalculator {
public:
    explicit MetricsCalculator(double target_usd = DEFAULT_TARGET_PORTFOLIO_USD);

    PortfolioMetrics calculate(const ProjectionInput& input,
                               double btc_market_cap_usd,
                               const ExchangeRateTable& rates) const;

    double target_usd() const { return target_usd_; }

private:
    double target_usd_;
};
