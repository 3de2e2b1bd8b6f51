#include "input_validator.hpp"
#include "util.hpp"
#include <cmath>

InputValidator::InputValidator(std::string default_currency)
    : default_currency_(util::to_upper(default_currency))
{}

std::optional<std::string> InputValidator::check_holdings(double holdings) {
    if (holdings <= 0) return std::string("Holdings must be greater than 0.");
    return std::nullopt;
}

std::optional<std::string> InputValidator::check_price(double price) {
    if (price <= 0) return std::string("Current price must be greater than 0.");
    if (!std::isfinite(price * 100.0)) return std::string("Current price is out of range.");
    return std::nullopt;
}

std::optional<std::string> InputValidator::check_supply(double supply_billions) {
    if (supply_billions < 0) return std::string("Circulating supply must not be negative.");
    return std::nullopt;
}

ValidatedInput InputValidator::reject(const std::string& field, const std::string& message) {
    ValidatedInput result;
    result.field = field;
    result.error = message;
    return result;
}

ValidatedInput InputValidator::validate(const RawProjectionInput& raw,
                                        std::optional<double> fallback_price,
                                        std::optional<double> fallback_supply_billions) const {
    auto holdings = util::parse_number(raw.holdings);
    if (!holdings) {
        return reject("holdings", "Please enter a valid number for holdings.");
    }
    if (auto err = check_holdings(*holdings)) {
        return reject("holdings", *err);
    }

    std::optional<double> price = fallback_price;
    if (raw.current_price && !util::trim(*raw.current_price).empty()) {
        price = util::parse_number(*raw.current_price);
        if (!price) {
            return reject("price", "Please enter a valid number for current price.");
        }
    }
    if (!price) {
        return reject("price", "Current price unavailable; enter it or fetch market data.");
    }
    if (auto err = check_price(*price)) {
        return reject("price", *err);
    }

    std::optional<double> supply = fallback_supply_billions;
    if (raw.circulating_supply_billions && !util::trim(*raw.circulating_supply_billions).empty()) {
        supply = util::parse_number(*raw.circulating_supply_billions);
        if (!supply) {
            return reject("supply", "Please enter a valid number for circulating supply.");
        }
    }
    if (!supply) {
        return reject("supply", "Circulating supply unavailable; enter it or fetch market data.");
    }
    if (auto err = check_supply(*supply)) {
        return reject("supply", *err);
    }

    ProjectionInput input;
    input.holdings = *holdings;
    input.current_price_usd = *price;
    input.circulating_supply_billions = *supply;
    input.currency = default_currency_;
    if (raw.currency && !util::trim(*raw.currency).empty()) {
        input.currency = util::to_upper(util::trim(*raw.currency));
    }

    ValidatedInput result;
    result.input = input;
    return result;
}
