#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/cg_client.hpp"

using Catch::Approx;

TEST_CASE("CoinGecko spot data parsing", "[coingecko]") {
    auto prices = nlohmann::json::parse(R"({
        "kaspa": {"usd": 0.2711, "usd_market_cap": 6900000000},
        "bitcoin": {"usd": 60000, "usd_market_cap": 1180000000000}
    })");
    auto detail = nlohmann::json::parse(R"({
        "id": "kaspa",
        "market_data": {"circulating_supply": 25600000000}
    })");

    SECTION("Complete responses") {
        auto spot = CoinGeckoClient::parse_spot_data("kaspa", prices, detail);

        REQUIRE(spot.has_value());
        REQUIRE(spot->price == 0.2711);
        REQUIRE(spot->circulating_supply == Approx(25.6e9));
        REQUIRE(spot->btc_market_cap == Approx(1.18e12));
    }

    SECTION("BTC market cap is optional") {
        prices.erase("bitcoin");
        auto spot = CoinGeckoClient::parse_spot_data("kaspa", prices, detail);

        REQUIRE(spot.has_value());
        REQUIRE(spot->btc_market_cap == 0.0);
    }

    SECTION("Missing coin price") {
        REQUIRE_FALSE(CoinGeckoClient::parse_spot_data("other", prices, detail).has_value());
    }

    SECTION("Null circulating supply") {
        detail["market_data"]["circulating_supply"] = nullptr;
        REQUIRE_FALSE(CoinGeckoClient::parse_spot_data("kaspa", prices, detail).has_value());
    }

    SECTION("Wrong value types do not throw") {
        prices["kaspa"]["usd"] = "not a number";
        REQUIRE_FALSE(CoinGeckoClient::parse_spot_data("kaspa", prices, detail).has_value());
    }
}

TEST_CASE("CoinGecko exchange rate parsing", "[coingecko]") {
    auto supported = ExchangeRateTable::defaults();
    auto response = nlohmann::json::parse(R"({
        "rates": {
            "btc": {"name": "Bitcoin", "unit": "BTC", "value": 1.0, "type": "crypto"},
            "usd": {"name": "US Dollar", "unit": "$", "value": 60000.0, "type": "fiat"},
            "eur": {"name": "Euro", "unit": "€", "value": 55200.0, "type": "fiat"},
            "gbp": {"name": "British Pound", "unit": "£", "value": 47400.0, "type": "fiat"},
            "jpy": {"name": "Japanese Yen", "unit": "¥", "value": 8970000.0, "type": "fiat"}
        }
    })");

    SECTION("Rates are rebased onto USD") {
        auto table = CoinGeckoClient::parse_exchange_rates(response, supported);

        REQUIRE(table.has_value());
        REQUIRE(table->rate("USD") == 1.0);
        REQUIRE(table->rate("EUR") == Approx(0.92));
        REQUIRE(table->rate("GBP") == Approx(0.79));
        REQUIRE(table->rate("JPY") == Approx(149.5));
        REQUIRE(table->symbol("JPY") == "¥");
    }

    SECTION("Currencies absent from the response keep their previous rate") {
        auto table = CoinGeckoClient::parse_exchange_rates(response, supported);
        REQUIRE(table->rate("AUD") == Approx(1.55));
    }

    SECTION("Unsupported currencies are not added") {
        auto table = CoinGeckoClient::parse_exchange_rates(response, supported);
        REQUIRE_FALSE(table->contains("BTC"));
    }

    SECTION("Missing USD anchor") {
        response["rates"].erase("usd");
        REQUIRE_FALSE(CoinGeckoClient::parse_exchange_rates(response, supported).has_value());
    }

    SECTION("Empty response") {
        REQUIRE_FALSE(CoinGeckoClient::parse_exchange_rates(nlohmann::json{}, supported).has_value());
    }
}

TEST_CASE("Exchange rate table", "[rates]") {
    auto rates = ExchangeRateTable::defaults();

    SECTION("Lookup is case-insensitive") {
        REQUIRE(rates.rate("jpy") == 149.50);
        REQUIRE(rates.symbol("aud") == "A$");
    }

    SECTION("Unknown currency falls back to identity") {
        REQUIRE(rates.rate("XYZ") == 1.0);
        REQUIRE(rates.symbol("XYZ") == "$");
        REQUIRE_FALSE(rates.contains("XYZ"));
    }

    SECTION("Unusable rates fall back to identity") {
        ExchangeRateTable bad({{"EUR", 0.0}, {"GBP", -1.0}}, {});
        REQUIRE(bad.rate("EUR") == 1.0);
        REQUIRE(bad.rate("GBP") == 1.0);
    }

    SECTION("USD is always the base") {
        ExchangeRateTable odd({{"USD", 2.0}}, {});
        REQUIRE(odd.rate("USD") == 1.0);
    }

    SECTION("JSON lists every currency") {
        auto j = rates.to_json();
        REQUIRE(j.size() == 5);
        REQUIRE(j["EUR"]["rate"].get<double>() == 0.92);
    }
}
