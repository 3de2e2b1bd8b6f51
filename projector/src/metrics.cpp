#include "metrics.hpp"
#include "row_builder.hpp"
#include "util.hpp"

MetricsCalculator::MetricsCalculator(double target_usd) : target_usd_(target_usd) {}

PortfolioMetrics MetricsCalculator::calculate(const ProjectionInput& input,
                                              double btc_market_cap_usd,
                                              const ExchangeRateTable& rates) const {
    PortfolioMetrics m;
    m.currency = util::to_upper(input.currency);
    m.symbol = rates.symbol(m.currency);
    m.target_usd = target_usd_;

    double rate = rates.rate(m.currency);
    double supply_units = input.circulating_supply_billions * SUPPLY_UNITS_PER_BILLION;

    double price_needed_usd = input.holdings > 0 ? target_usd_ / input.holdings : 0.0;
    double market_cap_needed_usd = price_needed_usd * supply_units;

    m.holdings = input.holdings;
    m.current_price = input.current_price_usd * rate;
    m.portfolio_value = input.holdings * input.current_price_usd * rate;
    m.market_cap = supply_units * input.current_price_usd * rate;
    m.price_needed_for_target = price_needed_usd * rate;
    m.market_cap_needed_for_target = market_cap_needed_usd * rate;
    m.btc_market_cap = btc_market_cap_usd * rate;
    m.btc_comparison_available = btc_market_cap_usd > 0;
    m.market_cap_ratio = m.btc_comparison_available ? market_cap_needed_usd / btc_market_cap_usd : 0.0;

    return m;
}
