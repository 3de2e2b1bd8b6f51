#include "projection_engine.hpp"
#include "row_builder.hpp"
#include "currency_adapter.hpp"

ProjectionEngine::ProjectionEngine(const ProjectionSettings& settings)
    : settings_(settings)
    , generator_(settings)
{}

ProjectionTable ProjectionEngine::generate_projection(const ProjectionInput& input,
                                                      const ExchangeRateTable& rates) const {
    auto prices = generator_.generate(input.current_price_usd);
    auto rows = RowBuilder::build(prices, input.holdings, input.current_price_usd,
                                  input.circulating_supply_billions);
    return CurrencyAdapter::adapt(rows, input.currency, rates);
}

ProjectionTable generate_projection(double holdings,
                                    double current_price_usd,
                                    double circulating_supply_billions,
                                    const std::string& currency,
                                    const ExchangeRateTable& rates) {
    ProjectionInput input;
    input.holdings = holdings;
    input.current_price_usd = current_price_usd;
    input.circulating_supply_billions = circulating_supply_billions;
    input.currency = currency;
    return ProjectionEngine().generate_projection(input, rates);
}
