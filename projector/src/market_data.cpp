#include "market_data.hpp"
#include "row_builder.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::optional<double> MarketSnapshot::supply_billions() const {
    if (!spot) return std::nullopt;
    return spot->circulating_supply / SUPPLY_UNITS_PER_BILLION;
}

MarketDataService::MarketDataService(std::shared_ptr<MarketDataSource> source,
                                     std::string coin_id,
                                     int cache_ttl_seconds)
    : source_(std::move(source))
    , coin_id_(std::move(coin_id))
    , cache_ttl_seconds_(cache_ttl_seconds)
{}

std::shared_ptr<const MarketSnapshot> MarketDataService::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

int64_t MarketDataService::last_success_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_success_ms_;
}

int MarketDataService::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

bool MarketDataService::is_fresh(const MarketSnapshot& snapshot) const {
    int64_t age_ms = util::current_timestamp_ms() - snapshot.fetched_at_ms;
    return snapshot.spot_live && age_ms < static_cast<int64_t>(cache_ttl_seconds_) * 1000;
}

std::shared_ptr<const MarketSnapshot> MarketDataService::refresh(bool force) {
    std::lock_guard<std::mutex> fetch_lock(fetch_mutex_);

    auto previous = latest();
    if (!force && previous && is_fresh(*previous)) {
        spdlog::debug("Market snapshot still fresh, skipping fetch");
        return previous;
    }

    auto next = std::make_shared<MarketSnapshot>();
    next->fetched_at_ms = util::current_timestamp_ms();
    next->fetched_at = util::current_iso8601();

    next->spot = source_->fetch_spot_data(coin_id_);
    next->spot_live = next->spot.has_value();
    if (!next->spot && previous && previous->spot) {
        spdlog::warn("Spot fetch for {} failed, keeping previous values", coin_id_);
        next->spot = previous->spot;
    }

    ExchangeRateTable supported = ExchangeRateTable::defaults();
    auto rates = source_->fetch_exchange_rates(supported);
    if (rates) {
        next->rates = *rates;
        next->rates_live = true;
    } else if (previous) {
        spdlog::warn("Exchange rate fetch failed, keeping previous table");
        next->rates = previous->rates;
        next->rates_live = previous->rates_live;
    } else {
        spdlog::warn("Exchange rate fetch failed, using built-in defaults");
        next->rates = supported;
        next->rates_live = false;
    }

    std::shared_ptr<const MarketSnapshot> published = next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_ = published;
        if (next->spot_live) {
            last_success_ms_ = next->fetched_at_ms;
            consecutive_failures_ = 0;
        } else {
            consecutive_failures_++;
        }
    }

    if (published->spot_live) {
        spdlog::info("Market data refreshed: {} ${:.6f}, supply {:.4f}B, BTC cap ${:.0f}",
                     coin_id_, published->spot->price, *published->supply_billions(),
                     published->spot->btc_market_cap);
    } else if (!published->spot) {
        spdlog::error("No market data available for {}", coin_id_);
    }

    return published;
}

std::future<std::shared_ptr<const MarketSnapshot>> MarketDataService::refresh_async(bool force) {
    return std::async(std::launch::async, [this, force]() { return refresh(force); });
}
