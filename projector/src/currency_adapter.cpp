#include "currency_adapter.hpp"
#include "util.hpp"
#include <algorithm>
#include <utility>

ProjectionRow CurrencyAdapter::convert(const ProjectionRow& row, double rate) {
    ProjectionRow out = row;
    out.display_price = util::round_cents(row.usd_price * rate);
    out.portfolio_value = row.portfolio_value * rate;
    out.market_cap = row.market_cap * rate;
    return out;
}

std::vector<ProjectionRow> CurrencyAdapter::sort_and_dedup(std::vector<ProjectionRow> rows) {
    std::sort(rows.begin(), rows.end(),
              [](const ProjectionRow& a, const ProjectionRow& b) {
                  if (a.display_price != b.display_price) {
                      return a.display_price < b.display_price;
                  }
                  return a.usd_price < b.usd_price;
              });

    // First occurrence per display price survives
    std::vector<ProjectionRow> unique;
    for (const auto& row : rows) {
        if (unique.empty() || unique.back().display_price != row.display_price) {
            unique.push_back(row);
        }
    }
    return unique;
}

ProjectionTable CurrencyAdapter::adapt(const std::vector<ProjectionRow>& usd_rows,
                                       const std::string& currency,
                                       const ExchangeRateTable& rates) {
    ProjectionTable table;
    table.currency = util::to_upper(currency);
    table.symbol = rates.symbol(table.currency);
    table.rate = rates.rate(table.currency);

    if (table.currency == "USD") {
        table.rows = usd_rows;
        for (auto& row : table.rows) {
            row.display_price = util::round_cents(row.usd_price);
        }
        return table;
    }

    std::vector<ProjectionRow> below;
    std::vector<ProjectionRow> above;
    std::vector<ProjectionRow> anchor;

    for (const auto& row : usd_rows) {
        ProjectionRow converted = convert(row, table.rate);
        switch (row.position) {
            case PricePosition::Below: below.push_back(converted); break;
            case PricePosition::At: anchor.push_back(converted); break;
            case PricePosition::Above: above.push_back(converted); break;
        }
    }

    below = sort_and_dedup(std::move(below));
    above = sort_and_dedup(std::move(above));

    if (!anchor.empty()) {
        double anchor_display = anchor.front().display_price;
        if (!below.empty() && below.back().display_price == anchor_display) {
            below.pop_back();
        }
        if (!above.empty() && above.front().display_price == anchor_display) {
            above.erase(above.begin());
        }
    }

    table.rows.reserve(below.size() + anchor.size() + above.size());
    table.rows.insert(table.rows.end(), below.begin(), below.end());
    table.rows.insert(table.rows.end(), anchor.begin(), anchor.end());
    table.rows.insert(table.rows.end(), above.begin(), above.end());

    return table;
}
