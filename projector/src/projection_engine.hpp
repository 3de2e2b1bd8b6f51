#pragma once

#include "projection_types.hpp"
#include "exchange_rates.hpp"
#include "interval_generator.hpp"

// Interval generation, row building and currency display in one call.
// Stateless apart from settings; same inputs give the same table.
class ProjectionEngine {
public:
    explicit ProjectionEngine(const ProjectionSettings& settings = ProjectionSettings{});

    ProjectionTable generate_projection(const ProjectionInput& input,
                                        const ExchangeRateTable& rates) const;

    const ProjectionSettings& settings() const { return settings_; }

private:
    ProjectionSettings settings_;
    IntervalGenerator generator_;
};

// Default settings (0.01 .. 1000, 9 below, 240 above)
ProjectionTable generate_projection(double holdings,
                                    double current_price_usd,
                                    double circulating_supply_billions,
                                    const std::string& currency,
                                    const ExchangeRateTable& rates);
