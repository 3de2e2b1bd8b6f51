#pragma once

#include "market_data.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<MarketDataService> market, std::string service_name);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    std::shared_ptr<MarketDataService> market_;
    std::string service_name_;
};
