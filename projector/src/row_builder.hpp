#pragma once

#include "projection_types.hpp"
#include <vector>

constexpr double SUPPLY_UNITS_PER_BILLION = 1e9;

class RowBuilder {
public:
    // All values in USD; display_price mirrors usd_price until conversion.
    // Inputs are assumed validated (holdings > 0, price > 0, supply >= 0).
    static std::vector<ProjectionRow> build(const std::vector<double>& usd_prices,
                                            double holdings,
                                            double current_price_usd,
                                            double circulating_supply_billions);

    static PricePosition classify(double usd_price, double anchor);
};
