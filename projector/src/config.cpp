#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    auto parsed = util::parse_number(val);
    if (!parsed) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
    return *parsed;
}

Config Config::from_env() {
    Config cfg;

    cfg.coingecko_base = get_env("COINGECKO_BASE", "https://api.coingecko.com/api/v3");
    cfg.coin_id = get_env("COIN_ID", "kaspa");
    cfg.coin_ticker = get_env("COIN_TICKER", "KAS");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);
    cfg.refresh_interval_seconds = get_env_int("REFRESH_INTERVAL_SECONDS", 300);
    cfg.cache_ttl_seconds = get_env_int("CACHE_TTL_SECONDS", 60);

    cfg.price_floor = get_env_double("PRICE_FLOOR", 0.01);
    cfg.price_ceiling = get_env_double("PRICE_CEILING", 1000.0);
    cfg.below_samples = get_env_int("BELOW_SAMPLES", 9);
    cfg.above_samples = get_env_int("ABOVE_SAMPLES", 240);
    cfg.target_portfolio_usd = get_env_double("TARGET_PORTFOLIO_USD", 1000000.0);
    cfg.default_currency = util::to_upper(get_env("DEFAULT_CURRENCY", "USD"));

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "projector");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (coin_id.empty()) {
        throw std::runtime_error("COIN_ID is required");
    }
    if (price_floor <= 0) {
        throw std::runtime_error("PRICE_FLOOR must be greater than 0");
    }
    if (price_ceiling <= price_floor) {
        throw std::runtime_error("PRICE_CEILING must be greater than PRICE_FLOOR");
    }
    if (below_samples < 1 || above_samples < 1) {
        throw std::runtime_error("BELOW_SAMPLES and ABOVE_SAMPLES must be at least 1");
    }
    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }
    if (target_portfolio_usd <= 0) {
        throw std::runtime_error("TARGET_PORTFOLIO_USD must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Coin: {} ({})", coin_id, coin_ticker);
    spdlog::info("  Price range: {:.2f} - {:.2f}, samples {}/{}",
                 price_floor, price_ceiling, below_samples, above_samples);
    spdlog::info("  Refresh: every {}s, cache TTL {}s", refresh_interval_seconds, cache_ttl_seconds);
}

ProjectionSettings Config::projection_settings() const {
    ProjectionSettings settings;
    settings.price_floor = price_floor;
    settings.price_ceiling = price_ceiling;
    settings.below_samples = below_samples;
    settings.above_samples = above_samples;
    return settings;
}
