#include "interval_generator.hpp"
#include "util.hpp"
#include <set>
#include <cmath>

IntervalGenerator::IntervalGenerator(const ProjectionSettings& settings)
    : settings_(settings)
{}

std::vector<double> IntervalGenerator::linspace(double start, double stop, int count) {
    std::vector<double> points;
    if (count <= 0) return points;
    if (count == 1) {
        points.push_back(start);
        return points;
    }

    double step = (stop - start) / (count - 1);
    for (int i = 0; i < count - 1; i++) {
        points.push_back(start + i * step);
    }
    points.push_back(stop);
    return points;
}

std::vector<double> IntervalGenerator::geomspace(double start, double stop, int count) {
    std::vector<double> points;
    if (count <= 0 || start <= 0.0 || stop <= 0.0) return points;
    if (count == 1) {
        points.push_back(start);
        return points;
    }

    double log_start = std::log(start);
    double log_step = (std::log(stop) - log_start) / (count - 1);
    points.push_back(start);
    for (int i = 1; i < count - 1; i++) {
        points.push_back(std::exp(log_start + i * log_step));
    }
    points.push_back(stop);
    return points;
}

std::vector<double> IntervalGenerator::below_section(double anchor) const {
    double top = util::round_cents(anchor - 0.01);
    if (top < settings_.price_floor) {
        return {};
    }
    return linspace(settings_.price_floor, top, settings_.below_samples);
}

std::vector<double> IntervalGenerator::above_section(double anchor) const {
    double bottom = util::round_cents(anchor + 0.01);
    if (bottom >= settings_.price_ceiling) {
        return {};
    }

    // Gap narrower than one step of the full floor..ceiling grid
    if (settings_.above_samples > 1) {
        double grid_step = std::pow(settings_.price_ceiling / settings_.price_floor,
                                    1.0 / (settings_.above_samples - 1));
        if (settings_.price_ceiling / bottom < grid_step) {
            return {};
        }
    }

    return geomspace(bottom, settings_.price_ceiling, settings_.above_samples);
}

std::vector<double> IntervalGenerator::generate(double current_price) const {
    double anchor = util::round_cents(current_price);

    std::set<double> prices;
    prices.insert(anchor);
    for (double p : below_section(anchor)) {
        prices.insert(util::round_cents(p));
    }
    for (double p : above_section(anchor)) {
        prices.insert(util::round_cents(p));
    }

    return std::vector<double>(prices.begin(), prices.end());
}
