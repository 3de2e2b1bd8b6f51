#include "row_builder.hpp"
#include "util.hpp"

PricePosition RowBuilder::classify(double usd_price, double anchor) {
    if (usd_price < anchor) return PricePosition::Below;
    if (usd_price == anchor) return PricePosition::At;
    return PricePosition::Above;
}

std::vector<ProjectionRow> RowBuilder::build(const std::vector<double>& usd_prices,
                                             double holdings,
                                             double current_price_usd,
                                             double circulating_supply_billions) {
    double anchor = util::round_cents(current_price_usd);
    double supply_units = circulating_supply_billions * SUPPLY_UNITS_PER_BILLION;

    std::vector<ProjectionRow> rows;
    rows.reserve(usd_prices.size());

    for (double price : usd_prices) {
        ProjectionRow row;
        row.usd_price = price;
        row.display_price = price;
        row.portfolio_value = holdings * price;
        row.market_cap = supply_units * price;
        row.position = classify(price, anchor);
        rows.push_back(row);
    }

    return rows;
}
