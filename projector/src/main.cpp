#include "config.hpp"
#include "cg_client.hpp"
#include "market_data.hpp"
#include "projection_engine.hpp"
#include "price_slider.hpp"
#include "metrics.hpp"
#include "input_validator.hpp"
#include "report_formatter.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("projector", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

struct RequestContext {
    std::optional<ProjectionInput> input;
    std::shared_ptr<const MarketSnapshot> snapshot;
};

std::optional<std::string> query_param(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) return std::nullopt;
    return req.get_param_value(name);
}

void reply_error(httplib::Response& res, int status, const std::string& message) {
    nlohmann::json body = {
        {"ok", false},
        {"error", message},
        {"ts", util::current_iso8601()}
    };
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// Validates query parameters, filling price and supply from the latest snapshot.
// Writes the error response and returns an empty input on failure.
RequestContext resolve_input(const httplib::Request& req,
                             httplib::Response& res,
                             const InputValidator& validator,
                             MarketDataService& market) {
    RequestContext ctx;
    ctx.snapshot = market.latest();

    RawProjectionInput raw;
    raw.holdings = query_param(req, "holdings").value_or("");
    raw.current_price = query_param(req, "price");
    raw.circulating_supply_billions = query_param(req, "supply");
    raw.currency = query_param(req, "currency");

    std::optional<double> fallback_price;
    std::optional<double> fallback_supply;
    if (ctx.snapshot && ctx.snapshot->spot) {
        fallback_price = ctx.snapshot->spot->price;
        fallback_supply = ctx.snapshot->supply_billions();
    }

    auto validated = validator.validate(raw, fallback_price, fallback_supply);
    if (!validated.is_valid()) {
        bool missing_market_data = (validated.field == "price" && !raw.current_price && !fallback_price) ||
                                   (validated.field == "supply" && !raw.circulating_supply_billions && !fallback_supply);
        reply_error(res, missing_market_data ? 503 : 400, *validated.error);
        spdlog::debug("Rejected request on {}: {}", validated.field, *validated.error);
        return ctx;
    }

    ctx.input = validated.input;
    return ctx;
}

ExchangeRateTable rates_for(const RequestContext& ctx) {
    return ctx.snapshot ? ctx.snapshot->rates : ExchangeRateTable::defaults();
}

void refresh_loop(std::shared_ptr<MarketDataService> market, int interval_seconds) {
    spdlog::info("Starting market data refresh loop ({}s)", interval_seconds);

    // The startup fetch runs separately, so wait one interval first
    while (!shutdown_requested) {
        for (int i = 0; i < interval_seconds && !shutdown_requested; i++) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (shutdown_requested) break;

        try {
            market->refresh();
        } catch (const std::exception& e) {
            spdlog::error("Market data refresh error: {}", e.what());
        }
    }

    spdlog::info("Market data refresh loop stopped");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("Portfolio Projector Service v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Initialize components
        auto cg = std::make_shared<CoinGeckoClient>(config->coingecko_base, config->request_timeout_ms);
        auto market = std::make_shared<MarketDataService>(cg, config->coin_id, config->cache_ttl_seconds);
        auto engine = std::make_shared<ProjectionEngine>(config->projection_settings());
        auto metrics = std::make_shared<MetricsCalculator>(config->target_portfolio_usd);
        auto validator = std::make_shared<InputValidator>(config->default_currency);
        auto formatter = std::make_shared<ReportFormatter>(config->coin_ticker);
        auto health = std::make_shared<HealthCheck>(market, config->service_name);

        // Serve requests while the first snapshot is still in flight
        auto initial_fetch = market->refresh_async(true);
        std::thread refresh_thread(refresh_loop, market, config->refresh_interval_seconds);

        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = health->is_healthy() ? 200 : 503;
        });

        server.Get("/rates", [market](const httplib::Request&, httplib::Response& res) {
            auto snapshot = market->latest();
            auto rates = snapshot ? snapshot->rates : ExchangeRateTable::defaults();
            nlohmann::json body = {
                {"ok", true},
                {"live", snapshot && snapshot->rates_live},
                {"rates", rates.to_json()}
            };
            res.set_content(body.dump(), "application/json");
        });

        server.Get("/projection", [=](const httplib::Request& req, httplib::Response& res) {
            try {
                auto ctx = resolve_input(req, res, *validator, *market);
                if (!ctx.input) return;

                auto table = engine->generate_projection(*ctx.input, rates_for(ctx));
                nlohmann::json body = formatter->table_json(table);
                body["ok"] = true;
                res.set_content(body.dump(), "application/json");
                spdlog::debug("Projection: {} rows in {}", table.rows.size(), table.currency);
            } catch (const std::exception& e) {
                spdlog::error("Failed to handle /projection: {}", e.what());
                reply_error(res, 500, "Internal error");
            }
        });

        server.Get("/export.csv", [=](const httplib::Request& req, httplib::Response& res) {
            try {
                auto ctx = resolve_input(req, res, *validator, *market);
                if (!ctx.input) return;

                auto table = engine->generate_projection(*ctx.input, rates_for(ctx));
                res.set_header("Content-Disposition", "attachment; filename=\"projection.csv\"");
                res.set_content(formatter->to_csv(table), "text/csv");
            } catch (const std::exception& e) {
                spdlog::error("Failed to handle /export.csv: {}", e.what());
                reply_error(res, 500, "Internal error");
            }
        });

        server.Get("/metrics", [=](const httplib::Request& req, httplib::Response& res) {
            try {
                auto ctx = resolve_input(req, res, *validator, *market);
                if (!ctx.input) return;

                double btc_cap = ctx.snapshot && ctx.snapshot->spot ? ctx.snapshot->spot->btc_market_cap : 0.0;
                auto m = metrics->calculate(*ctx.input, btc_cap, rates_for(ctx));

                nlohmann::json body = formatter->metrics_json(m);
                body["ok"] = true;
                body["summary"] = formatter->summary(m, query_param(req, "name").value_or(""));
                res.set_content(body.dump(), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("Failed to handle /metrics: {}", e.what());
                reply_error(res, 500, "Internal error");
            }
        });

        server.Get("/slider", [=](const httplib::Request& req, httplib::Response& res) {
            try {
                auto ctx = resolve_input(req, res, *validator, *market);
                if (!ctx.input) return;

                PriceSlider slider(ctx.input->current_price_usd, engine->settings().price_ceiling);

                double position = SLIDER_MIN_POSITION;
                if (auto target = query_param(req, "target_price")) {
                    auto price = util::parse_number(*target);
                    if (!price) {
                        reply_error(res, 400, "Please enter a valid number for target price.");
                        return;
                    }
                    position = slider.position_for(*price);
                } else if (auto pos = query_param(req, "position")) {
                    auto parsed = util::parse_number(*pos);
                    if (!parsed) {
                        reply_error(res, 400, "Please enter a valid number for slider position.");
                        return;
                    }
                    position = *parsed;
                }

                auto rates = rates_for(ctx);
                auto state = slider.state_at(position);
                auto row = slider.row_at(state.position, *ctx.input, rates);
                auto table = engine->generate_projection(*ctx.input, rates);
                auto nearest = PriceSlider::nearest_row(table, row.display_price);

                nlohmann::json body = {
                    {"ok", true},
                    {"position", state.position},
                    {"price", slider.price_at(state.position)},
                    {"floor", state.price_floor},
                    {"ceiling", state.price_ceiling},
                    {"row", formatter->row_json(row, table.symbol)},
                    {"nearest_row", nearest ? nlohmann::json(*nearest) : nlohmann::json(nullptr)}
                };
                res.set_content(body.dump(), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("Failed to handle /slider: {}", e.what());
                reply_error(res, 500, "Internal error");
            }
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Projector service started");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        server.stop();

        if (refresh_thread.joinable()) refresh_thread.join();
        try {
            initial_fetch.get();
        } catch (const std::exception& e) {
            spdlog::error("Initial market data fetch failed: {}", e.what());
        }
        if (http_thread.joinable()) http_thread.join();

        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
