#include "price_slider.hpp"
#include "row_builder.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

PriceSlider::PriceSlider(double current_price_usd, double price_ceiling)
    : floor_(std::max(util::round_cents(current_price_usd), SLIDER_MIN_FLOOR))
    , ceiling_(price_ceiling)
{}

double PriceSlider::price_at(double position) const {
    if (degenerate()) return floor_;

    double p = std::clamp(position, SLIDER_MIN_POSITION, SLIDER_MAX_POSITION);
    if (p == SLIDER_MAX_POSITION) return ceiling_;
    return floor_ * std::pow(ceiling_ / floor_, p / SLIDER_MAX_POSITION);
}

double PriceSlider::position_for(double price) const {
    if (degenerate() || !std::isfinite(price)) return SLIDER_MIN_POSITION;

    double clamped = std::clamp(price, floor_, ceiling_);
    double position = SLIDER_MAX_POSITION * std::log(clamped / floor_) / std::log(ceiling_ / floor_);
    return std::clamp(position, SLIDER_MIN_POSITION, SLIDER_MAX_POSITION);
}

SliderState PriceSlider::state_at(double position) const {
    SliderState state;
    state.position = std::clamp(position, SLIDER_MIN_POSITION, SLIDER_MAX_POSITION);
    state.price_floor = floor_;
    state.price_ceiling = ceiling_;
    return state;
}

ProjectionRow PriceSlider::row_at(double position, const ProjectionInput& input,
                                  const ExchangeRateTable& rates) const {
    double price = price_at(position);
    double rate = rates.rate(input.currency);
    double supply_units = input.circulating_supply_billions * SUPPLY_UNITS_PER_BILLION;

    ProjectionRow row;
    row.usd_price = price;
    row.display_price = util::round_cents(price * rate);
    row.portfolio_value = input.holdings * price * rate;
    row.market_cap = supply_units * price * rate;
    row.position = RowBuilder::classify(util::round_cents(price),
                                        util::round_cents(input.current_price_usd));
    return row;
}

std::optional<size_t> PriceSlider::nearest_row(const ProjectionTable& table,
                                               double target_display_price) {
    if (table.rows.empty()) {
        return std::nullopt;
    }

    size_t best = 0;
    double best_diff = std::fabs(table.rows[0].display_price - target_display_price);
    for (size_t i = 1; i < table.rows.size(); i++) {
        double diff = std::fabs(table.rows[i].display_price - target_display_price);
        if (diff < best_diff) {
            best = i;
            best_diff = diff;
        }
    }
    return best;
}

double price_at_slider_position(double position, double current_price_usd, double ceiling) {
    return PriceSlider(current_price_usd, ceiling).price_at(position);
}

double slider_position_for_price(double price, double current_price_usd, double ceiling) {
    return PriceSlider(current_price_usd, ceiling).position_for(price);
}
