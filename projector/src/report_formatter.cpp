#include "report_formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <cctype>

ReportFormatter::ReportFormatter(std::string ticker) : ticker_(std::move(ticker)) {}

std::string ReportFormatter::money(const std::string& symbol, double value) {
    return symbol + util::format_grouped(value, 2);
}

std::string ReportFormatter::title_for(const std::string& portfolio_name) {
    std::string name = util::trim(portfolio_name);
    if (name.empty()) {
        return "Unnamed Portfolio Projection";
    }

    // First letter upper, rest lower
    for (size_t i = 0; i < name.size(); i++) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        name[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
    }
    return name + " Portfolio Projection";
}

std::string ReportFormatter::csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string ReportFormatter::to_csv(const ProjectionTable& table) const {
    std::string out = fmt::format("Price ({0}),Portfolio ({0}),Market Cap ({0}),Position\n",
                                  table.currency);

    for (const auto& row : table.rows) {
        out += csv_field(fmt::format("{}{:.2f}", table.symbol, row.display_price)) + ",";
        out += csv_field(money(table.symbol, row.portfolio_value)) + ",";
        out += csv_field(money(table.symbol, row.market_cap)) + ",";
        out += position_string(row.position) + "\n";
    }

    return out;
}

std::string ReportFormatter::summary(const PortfolioMetrics& m, const std::string& portfolio_name) const {
    std::string title = title_for(portfolio_name);
    std::string name = title.substr(0, title.size() - std::string(" Portfolio Projection").size());

    std::string text = fmt::format(
        "The {} portfolio, holding {} {} with a current portfolio value of {} "
        "and a market cap of {}, would require a {} price of {} and a market cap of {}",
        name, util::format_grouped(m.holdings, 2), ticker_,
        money(m.symbol, m.portfolio_value), money(m.symbol, m.market_cap),
        ticker_, money(m.symbol, m.price_needed_for_target),
        money(m.symbol, m.market_cap_needed_for_target));

    if (m.btc_comparison_available) {
        text += fmt::format(" - approximately {:.2f} times the current Bitcoin market cap of {} -",
                            m.market_cap_ratio, money(m.symbol, m.btc_market_cap));
    }

    text += fmt::format(" to reach a ${} valuation.", util::format_grouped(m.target_usd, 0));
    return text;
}

nlohmann::json ReportFormatter::row_json(const ProjectionRow& row, const std::string& symbol) const {
    return {
        {"usd_price", row.usd_price},
        {"price", row.display_price},
        {"portfolio_value", row.portfolio_value},
        {"market_cap", row.market_cap},
        {"position", position_string(row.position)},
        {"label", fmt::format("{}{:.2f}", symbol, row.display_price)}
    };
}

nlohmann::json ReportFormatter::table_json(const ProjectionTable& table) const {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : table.rows) {
        rows.push_back(row_json(row, table.symbol));
    }

    return {
        {"currency", table.currency},
        {"symbol", table.symbol},
        {"rate", table.rate},
        {"anchor_index", table.anchor_index()},
        {"rows", rows}
    };
}

nlohmann::json ReportFormatter::metrics_json(const PortfolioMetrics& m) const {
    nlohmann::json j = {
        {"currency", m.currency},
        {"symbol", m.symbol},
        {"holdings", m.holdings},
        {"current_price", m.current_price},
        {"portfolio_value", m.portfolio_value},
        {"market_cap", m.market_cap},
        {"target_usd", m.target_usd},
        {"price_needed_for_target", m.price_needed_for_target},
        {"market_cap_needed_for_target", m.market_cap_needed_for_target},
        {"btc_comparison_available", m.btc_comparison_available}
    };

    if (m.btc_comparison_available) {
        j["btc_market_cap"] = m.btc_market_cap;
        j["market_cap_ratio"] = m.market_cap_ratio;
    }
    return j;
}
