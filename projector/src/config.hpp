#pragma once

#include "projection_types.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // CoinGecko
    std::string coingecko_base;
    std::string coin_id;
    std::string coin_ticker;
    int request_timeout_ms;
    int refresh_interval_seconds;
    int cache_ttl_seconds;

    // Projection
    double price_floor;
    double price_ceiling;
    int below_samples;
    int above_samples;
    double target_portfolio_usd;
    std::string default_currency;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    ProjectionSettings projection_settings() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
