#pragma once

#include "projection_types.hpp"
#include <string>
#include <optional>

// Raw text as it arrives from a form or query string. Empty optionals mean
// the caller wants the latest fetched value instead.
struct RawProjectionInput {
    std::string holdings;
    std::optional<std::string> current_price;
    std::optional<std::string> circulating_supply_billions;
    std::optional<std::string> currency;
};

struct ValidatedInput {
    std::optional<ProjectionInput> input;
    std::optional<std::string> error;
    std::string field;

    bool is_valid() const { return !error.has_value(); }
};

class InputValidator {
public:
    explicit InputValidator(std::string default_currency = "USD");

    // fallback_price / fallback_supply come from the latest market snapshot
    ValidatedInput validate(const RawProjectionInput& raw,
                            std::optional<double> fallback_price,
                            std::optional<double> fallback_supply_billions) const;

    static std::optional<std::string> check_holdings(double holdings);
    static std::optional<std::string> check_price(double price);
    static std::optional<std::string> check_supply(double supply_billions);

private:
    std::string default_currency_;

    static ValidatedInput reject(const std::string& field, const std::string& message);
};
