#include "cg_client.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

CoinGeckoClient::CoinGeckoClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for CoinGecko");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "projector/1.0");
}

CoinGeckoClient::~CoinGeckoClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t CoinGeckoClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json CoinGeckoClient::make_request(const std::string& endpoint) {
    std::string response_string;
    std::string url = base_url_ + endpoint;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        spdlog::error("CoinGecko request {} failed: {}", endpoint, curl_easy_strerror(res));
        return nlohmann::json{};
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        spdlog::error("CoinGecko request {} returned HTTP {}", endpoint, status);
        return nlohmann::json{};
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse CoinGecko response: {}", e.what());
        return nlohmann::json{};
    }
}

std::optional<SpotData> CoinGeckoClient::parse_spot_data(const std::string& coin_id,
                                                         const nlohmann::json& simple_price,
                                                         const nlohmann::json& coin_detail) {
    try {
        if (!simple_price.contains(coin_id) || !simple_price[coin_id].contains("usd")) {
            return std::nullopt;
        }
        if (!coin_detail.contains("market_data") ||
            !coin_detail["market_data"].contains("circulating_supply") ||
            coin_detail["market_data"]["circulating_supply"].is_null()) {
            return std::nullopt;
        }

        SpotData spot;
        spot.price = simple_price[coin_id]["usd"].get<double>();
        spot.circulating_supply = coin_detail["market_data"]["circulating_supply"].get<double>();
        spot.btc_market_cap = 0.0;

        if (simple_price.contains("bitcoin") && simple_price["bitcoin"].contains("usd_market_cap")) {
            spot.btc_market_cap = simple_price["bitcoin"]["usd_market_cap"].get<double>();
        }

        return spot;
    } catch (const std::exception& e) {
        spdlog::error("Malformed spot data for {}: {}", coin_id, e.what());
        return std::nullopt;
    }
}

std::optional<ExchangeRateTable> CoinGeckoClient::parse_exchange_rates(const nlohmann::json& response,
                                                                       const ExchangeRateTable& supported) {
    try {
        if (!response.contains("rates") || !response["rates"].contains("usd")) {
            return std::nullopt;
        }

        const auto& rates = response["rates"];
        double usd_per_btc = rates["usd"]["value"].get<double>();
        if (usd_per_btc <= 0) {
            return std::nullopt;
        }

        // Rebase BTC-denominated values onto USD
        std::map<std::string, double> rebased;
        std::map<std::string, std::string> symbols;
        for (const auto& code : supported.currencies()) {
            std::string key = code;
            std::transform(key.begin(), key.end(), key.begin(), ::tolower);

            symbols[code] = supported.symbol(code);
            if (rates.contains(key) && rates[key].contains("value")) {
                rebased[code] = rates[key]["value"].get<double>() / usd_per_btc;
            } else {
                rebased[code] = supported.rate(code);
                spdlog::warn("No {} rate in response, keeping {:.4f}", code, rebased[code]);
            }
        }
        rebased["USD"] = 1.0;

        return ExchangeRateTable(rebased, symbols);
    } catch (const std::exception& e) {
        spdlog::error("Malformed exchange rate response: {}", e.what());
        return std::nullopt;
    }
}

std::optional<SpotData> CoinGeckoClient::fetch_spot_data(const std::string& coin_id) {
    auto prices = make_request("/simple/price?ids=" + coin_id +
                               ",bitcoin&vs_currencies=usd&include_market_cap=true");
    if (prices.empty()) {
        return std::nullopt;
    }

    auto detail = make_request("/coins/" + coin_id +
                               "?localization=false&tickers=false&community_data=false&developer_data=false");
    if (detail.empty()) {
        return std::nullopt;
    }

    return parse_spot_data(coin_id, prices, detail);
}

std::optional<ExchangeRateTable> CoinGeckoClient::fetch_exchange_rates(const ExchangeRateTable& supported) {
    auto response = make_request("/exchange_rates");
    if (response.empty()) {
        return std::nullopt;
    }
    return parse_exchange_rates(response, supported);
}
