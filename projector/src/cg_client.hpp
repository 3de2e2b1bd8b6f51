#pragma once

#include "market_source.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

class CoinGeckoClient : public MarketDataSource {
public:
    explicit CoinGeckoClient(const std::string& base_url, int timeout_ms = 8000);
    ~CoinGeckoClient() override;

    CoinGeckoClient(const CoinGeckoClient&) = delete;
    CoinGeckoClient& operator=(const CoinGeckoClient&) = delete;

    std::optional<SpotData> fetch_spot_data(const std::string& coin_id) override;
    std::optional<ExchangeRateTable> fetch_exchange_rates(const ExchangeRateTable& supported) override;

    // Response parsing, kept apart from transport
    static std::optional<SpotData> parse_spot_data(const std::string& coin_id,
                                                   const nlohmann::json& simple_price,
                                                   const nlohmann::json& coin_detail);
    static std::optional<ExchangeRateTable> parse_exchange_rates(const nlohmann::json& response,
                                                                 const ExchangeRateTable& supported);

private:
    std::string base_url_;
    int timeout_ms_;
    CURL* curl_;

    nlohmann::json make_request(const std::string& endpoint);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
