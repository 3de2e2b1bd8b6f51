#pragma once

#include "projection_types.hpp"
#include "exchange_rates.hpp"
#include <optional>
#include <cstddef>

constexpr double SLIDER_MIN_POSITION = 0.0;
constexpr double SLIDER_MAX_POSITION = 100.0;
constexpr double SLIDER_MIN_FLOOR = 0.01;

struct SliderState {
    double position;
    double price_floor;
    double price_ceiling;
};

// Log-scale mapping between a 0..100 control position and a USD price.
// The floor follows the current price, so the domain rescales with it.
class PriceSlider {
public:
    PriceSlider(double current_price_usd, double price_ceiling);

    double floor() const { return floor_; }
    double ceiling() const { return ceiling_; }

    double price_at(double position) const;
    double position_for(double price) const;
    SliderState state_at(double position) const;

    // One on-demand row for the slider price, in display currency
    ProjectionRow row_at(double position, const ProjectionInput& input,
                         const ExchangeRateTable& rates) const;

    // Row whose display price is closest to target; earliest row wins ties
    static std::optional<size_t> nearest_row(const ProjectionTable& table,
                                             double target_display_price);

private:
    double floor_;
    double ceiling_;

    bool degenerate() const { return ceiling_ <= floor_; }
};

double price_at_slider_position(double position, double current_price_usd, double ceiling);
double slider_position_for_price(double price, double current_price_usd, double ceiling);
