#pragma once

#include <string>
#include <vector>
#include <cstddef>

enum class PricePosition {
    Below,   // under the rounded current price
    At,      // the anchor row
    Above
};

std::string position_string(PricePosition position);

struct ProjectionRow {
    double usd_price;
    double display_price;
    double portfolio_value;   // display currency
    double market_cap;        // display currency
    PricePosition position;
};

struct ProjectionTable {
    std::string currency;
    std::string symbol;
    double rate;
    std::vector<ProjectionRow> rows;

    // Index of the row tagged At, or rows.size() when there is none
    size_t anchor_index() const;
};

// Scalar inputs for one projection cycle. Already validated.
struct ProjectionInput {
    double holdings;
    double current_price_usd;
    double circulating_supply_billions;
    std::string currency;
};

struct ProjectionSettings {
    double price_floor = 0.01;
    double price_ceiling = 1000.0;
    int below_samples = 9;
    int above_samples = 240;
};
