#include "projection_types.hpp"

std::string position_string(PricePosition position) {
    switch (position) {
        case PricePosition::Below: return "below";
        case PricePosition::At: return "at";
        case PricePosition::Above: return "above";
        default: return "unknown";
    }
}

size_t ProjectionTable::anchor_index() const {
    for (size_t i = 0; i < rows.size(); i++) {
        if (rows[i].position == PricePosition::At) {
            return i;
        }
    }
    return rows.size();
}
