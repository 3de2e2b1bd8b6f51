#pragma once

#include "market_source.hpp"
#include "exchange_rates.hpp"
#include <memory>
#include <mutex>
#include <future>
#include <string>
#include <cstdint>

struct MarketSnapshot {
    std::optional<SpotData> spot;
    bool spot_live;               // false when spot is carried over from an earlier fetch
    ExchangeRateTable rates;
    bool rates_live;              // false when rates are defaults or carried over
    int64_t fetched_at_ms;
    std::string fetched_at;

    std::optional<double> supply_billions() const;
};

// Fetches spot data and exchange rates off the request path and publishes
// immutable snapshots. A refresh inside the TTL returns the cached snapshot.
class MarketDataService {
public:
    MarketDataService(std::shared_ptr<MarketDataSource> source,
                      std::string coin_id,
                      int cache_ttl_seconds = 60);

    std::shared_ptr<const MarketSnapshot> latest() const;

    std::shared_ptr<const MarketSnapshot> refresh(bool force = false);
    std::future<std::shared_ptr<const MarketSnapshot>> refresh_async(bool force = false);

    int64_t last_success_ms() const;
    int consecutive_failures() const;

private:
    std::shared_ptr<MarketDataSource> source_;
    std::string coin_id_;
    int cache_ttl_seconds_;

    mutable std::mutex mutex_;         // guards snapshot_ and counters
    std::mutex fetch_mutex_;           // one fetch in flight
    std::shared_ptr<const MarketSnapshot> snapshot_;
    int64_t last_success_ms_ = 0;
    int consecutive_failures_ = 0;

    bool is_fresh(const MarketSnapshot& snapshot) const;
};
