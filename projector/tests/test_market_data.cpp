#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/market_data.hpp"

using Catch::Approx;

namespace {
class FakeSource : public MarketDataSource {
public:
    std::optional<SpotData> spot;
    std::optional<ExchangeRateTable> rates;
    int spot_calls = 0;
    int rate_calls = 0;

    std::optional<SpotData> fetch_spot_data(const std::string&) override {
        spot_calls++;
        return spot;
    }

    std::optional<ExchangeRateTable> fetch_exchange_rates(const ExchangeRateTable&) override {
        rate_calls++;
        return rates;
    }
};

SpotData spot_of(double price) {
    SpotData s;
    s.price = price;
    s.circulating_supply = 25.6e9;
    s.btc_market_cap = 1.2e12;
    return s;
}
}

TEST_CASE("Market data service", "[market_data]") {
    auto source = std::make_shared<FakeSource>();
    MarketDataService service(source, "kaspa", 60);

    SECTION("No snapshot before the first refresh") {
        REQUIRE(service.latest() == nullptr);
    }

    SECTION("Successful refresh publishes live data") {
        source->spot = spot_of(0.27);
        source->rates = ExchangeRateTable({{"USD", 1.0}, {"EUR", 0.9}}, {{"EUR", "€"}});

        auto snapshot = service.refresh();

        REQUIRE(snapshot->spot_live);
        REQUIRE(snapshot->rates_live);
        REQUIRE(snapshot->spot->price == 0.27);
        REQUIRE(*snapshot->supply_billions() == Approx(25.6));
        REQUIRE(snapshot->rates.rate("EUR") == 0.9);
        REQUIRE(service.latest() == snapshot);
        REQUIRE(service.consecutive_failures() == 0);
        REQUIRE(service.last_success_ms() > 0);
    }

    SECTION("Refresh inside the TTL serves the cached snapshot") {
        source->spot = spot_of(0.27);
        auto first = service.refresh();
        auto second = service.refresh();

        REQUIRE(first == second);
        REQUIRE(source->spot_calls == 1);

        auto forced = service.refresh(true);
        REQUIRE(forced != first);
        REQUIRE(source->spot_calls == 2);
    }

    SECTION("Rate failure on first fetch uses the defaults") {
        source->spot = spot_of(0.27);
        auto snapshot = service.refresh();

        REQUIRE_FALSE(snapshot->rates_live);
        REQUIRE(snapshot->rates.rate("JPY") == 149.50);
    }

    SECTION("Spot failure keeps the previous values but marks them stale") {
        source->spot = spot_of(0.27);
        source->rates = ExchangeRateTable({{"EUR", 0.9}}, {});
        auto first = service.refresh();

        source->spot.reset();
        source->rates.reset();
        auto second = service.refresh(true);

        REQUIRE(second != first);
        REQUIRE(second->spot.has_value());
        REQUIRE(second->spot->price == 0.27);
        REQUIRE_FALSE(second->spot_live);
        REQUIRE(second->rates.rate("EUR") == 0.9);
        REQUIRE(service.consecutive_failures() == 1);

        // Published snapshots are never modified
        REQUIRE(first->spot_live);
    }

    SECTION("Stale data is refetched even inside the TTL") {
        auto empty = service.refresh();
        REQUIRE_FALSE(empty->spot.has_value());

        source->spot = spot_of(0.3);
        auto next = service.refresh();
        REQUIRE(next->spot_live);
        REQUIRE(source->spot_calls == 2);
    }

    SECTION("Asynchronous refresh") {
        source->spot = spot_of(0.31);
        auto future = service.refresh_async();
        auto snapshot = future.get();

        REQUIRE(snapshot->spot->price == 0.31);
        REQUIRE(service.latest() == snapshot);
    }
}
