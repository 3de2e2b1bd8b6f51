#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/price_slider.hpp"
#include "../src/projection_engine.hpp"
#include <cmath>

using Catch::Approx;

TEST_CASE("Slider price mapping", "[slider]") {
    PriceSlider slider(0.25, 1000.0);

    SECTION("Endpoints map to floor and ceiling") {
        REQUIRE(slider.floor() == 0.25);
        REQUIRE(slider.price_at(0) == 0.25);
        REQUIRE(slider.price_at(100) == 1000.0);
    }

    SECTION("Midpoint is the geometric mean") {
        REQUIRE(slider.price_at(50) == Approx(std::sqrt(0.25 * 1000.0)));
    }

    SECTION("Mapping is monotonic") {
        double prev = slider.price_at(0);
        for (int i = 1; i <= 100; i++) {
            double cur = slider.price_at(i);
            REQUIRE(cur > prev);
            prev = cur;
        }
    }

    SECTION("Round trip through price returns the position") {
        for (int i = 0; i <= 200; i++) {
            double position = i * 0.5;
            double price = slider.price_at(position);
            REQUIRE(slider.position_for(price) == Approx(position).margin(1e-9));
        }
    }

    SECTION("Out of range input is clamped") {
        REQUIRE(slider.price_at(-10) == 0.25);
        REQUIRE(slider.price_at(150) == 1000.0);
        REQUIRE(slider.position_for(0.001) == 0.0);
        REQUIRE(slider.position_for(5000.0) == 100.0);
    }

    SECTION("Free functions agree with the class") {
        REQUIRE(price_at_slider_position(37.5, 0.25, 1000.0) == slider.price_at(37.5));
        REQUIRE(slider_position_for_price(12.0, 0.25, 1000.0) == slider.position_for(12.0));
    }
}

TEST_CASE("Slider floor follows the current price", "[slider]") {
    SECTION("Floor never drops under one cent") {
        PriceSlider slider(0.001, 1000.0);
        REQUIRE(slider.floor() == 0.01);
        REQUIRE(slider.price_at(0) == 0.01);
    }

    SECTION("Floor is the rounded current price") {
        PriceSlider slider(0.2711, 1000.0);
        REQUIRE(slider.floor() == 0.27);
    }

    SECTION("Current price above ceiling collapses the range") {
        PriceSlider slider(1500.0, 1000.0);
        REQUIRE(slider.price_at(50) == 1500.0);
        REQUIRE(slider.position_for(2000.0) == 0.0);
    }

    SECTION("State reports the clamped position and bounds") {
        PriceSlider slider(0.5, 1000.0);
        auto state = slider.state_at(120);
        REQUIRE(state.position == 100.0);
        REQUIRE(state.price_floor == 0.5);
        REQUIRE(state.price_ceiling == 1000.0);
    }
}

TEST_CASE("Slider row and nearest table row", "[slider]") {
    auto rates = ExchangeRateTable::defaults();

    ProjectionInput input;
    input.holdings = 1000;
    input.current_price_usd = 0.25;
    input.circulating_supply_billions = 25;
    input.currency = "EUR";

    SECTION("Row at position zero is the anchor") {
        PriceSlider slider(input.current_price_usd, 1000.0);
        auto row = slider.row_at(0, input, rates);

        REQUIRE(row.position == PricePosition::At);
        REQUIRE(row.usd_price == 0.25);
        REQUIRE(row.display_price == 0.23);
        REQUIRE(row.portfolio_value == Approx(1000 * 0.25 * 0.92));
    }

    SECTION("Rows past position zero are above") {
        PriceSlider slider(input.current_price_usd, 1000.0);
        auto row = slider.row_at(60, input, rates);
        REQUIRE(row.position == PricePosition::Above);
        REQUIRE(row.market_cap == Approx(25e9 * row.usd_price * 0.92));
    }

    SECTION("Nearest row by display price, earliest wins ties") {
        ProjectionTable table;
        for (double p : {1.0, 2.0, 3.0, 4.0}) {
            ProjectionRow row{};
            row.usd_price = p;
            row.display_price = p;
            table.rows.push_back(row);
        }

        REQUIRE(PriceSlider::nearest_row(table, 2.4) == 1u);
        REQUIRE(PriceSlider::nearest_row(table, 2.5) == 1u);
        REQUIRE(PriceSlider::nearest_row(table, 0.0) == 0u);
        REQUIRE(PriceSlider::nearest_row(table, 99.0) == 3u);
    }

    SECTION("Empty table has no nearest row") {
        ProjectionTable table;
        REQUIRE_FALSE(PriceSlider::nearest_row(table, 1.0).has_value());
    }

    SECTION("Slider at the anchor links to the anchor row") {
        ProjectionEngine engine;
        auto table = engine.generate_projection(input, rates);
        PriceSlider slider(input.current_price_usd, engine.settings().price_ceiling);

        auto row = slider.row_at(0, input, rates);
        auto nearest = PriceSlider::nearest_row(table, row.display_price);

        REQUIRE(nearest.has_value());
        REQUIRE(*nearest == table.anchor_index());
    }
}
