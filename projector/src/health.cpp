#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<MarketDataService> market, std::string service_name)
    : market_(std::move(market)), service_name_(std::move(service_name)) {}

nlohmann::json HealthCheck::get_status() const {
    auto snapshot = market_->latest();
    bool has_spot = snapshot && snapshot->spot.has_value();

    nlohmann::json status = {
        {"ok", has_spot},
        {"service", service_name_},
        {"market_data", !snapshot ? "pending" : (snapshot->spot_live ? "up" : "degraded")},
        {"rates", snapshot && snapshot->rates_live ? "live" : "default"},
        {"consecutive_failures", market_->consecutive_failures()},
        {"ts", util::current_iso8601()}
    };

    if (snapshot) {
        status["fetched_at"] = snapshot->fetched_at;
    }

    return status;
}

bool HealthCheck::is_healthy() const {
    auto snapshot = market_->latest();
    return snapshot && snapshot->spot.has_value();
}
