#pragma once

#include "projection_types.hpp"
#include "exchange_rates.hpp"
#include <string>
#include <vector>

class CurrencyAdapter {
public:
    // Converts USD rows into the display currency. For anything but USD,
    // rows that collapse onto the same rounded display price are reduced to
    // one (smallest underlying USD price wins) and neighbours of the anchor
    // sharing its display price are dropped.
    static ProjectionTable adapt(const std::vector<ProjectionRow>& usd_rows,
                                 const std::string& currency,
                                 const ExchangeRateTable& rates);

private:
    static ProjectionRow convert(const ProjectionRow& row, double rate);
    static std::vector<ProjectionRow> sort_and_dedup(std::vector<ProjectionRow> rows);
};
