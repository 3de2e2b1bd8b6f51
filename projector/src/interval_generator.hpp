#pragma once

#include "projection_types.hpp"
#include <vector>

class IntervalGenerator {
public:
    explicit IntervalGenerator(const ProjectionSettings& settings);

    // Ascending, unique, cent-rounded USD prices from floor to ceiling,
    // always containing round_cents(current_price)
    std::vector<double> generate(double current_price) const;

    std::vector<double> below_section(double anchor) const;
    std::vector<double> above_section(double anchor) const;

    static std::vector<double> linspace(double start, double stop, int count);
    static std::vector<double> geomspace(double start, double stop, int count);

private:
    ProjectionSettings settings_;
};
