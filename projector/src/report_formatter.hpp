#pragma once

#include "projection_types.hpp"
#include "metrics.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

class ReportFormatter {
public:
    explicit ReportFormatter(std::string ticker = "KAS");

    std::string to_csv(const ProjectionTable& table) const;
    std::string summary(const PortfolioMetrics& metrics, const std::string& portfolio_name) const;

    nlohmann::json table_json(const ProjectionTable& table) const;
    nlohmann::json metrics_json(const PortfolioMetrics& metrics) const;
    nlohmann::json row_json(const ProjectionRow& row, const std::string& symbol) const;

    static std::string money(const std::string& symbol, double value);
    static std::string title_for(const std::string& portfolio_name);

private:
    std::string ticker_;

    static std::string csv_field(const std::string& value);
};
