#pragma once

#include "cancel_token.hpp"
#include "market_data.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct CatalogEntry {
    std::string symbol;
    std::string name;
    std::string sector;
};

struct Ticker {
    std::string symbol;
    std::string name;
    std::string sector;
    std::vector<double> returns;   // daily, oldest first
    bool synthetic = false;

    double return_1y() const;          // compounded over the series
    double annualized_mean() const;    // mean daily return * 252
};

const std::vector<CatalogEntry>& default_catalog();

// Tickers whose sector is in `sectors`, in catalog order. Falls back to the
// whole universe when nothing matches.
std::vector<Ticker> filter_by_sectors(const std::vector<Ticker>& universe,
                                      const std::vector<std::string>& sectors);

class CandidateUniverse {
public:
    CandidateUniverse(std::vector<CatalogEntry> catalog,
                      std::shared_ptr<MarketDataSource> source,
                      int concurrency,
                      uint64_t seed);

    // Fetches every series with at most `concurrency` fetches in flight.
    // A failed fetch yields a synthetic series for that ticker only.
    // Throws CancelledError if the token is cancelled mid-load.
    std::vector<Ticker> load(const CancelToken& token) const;

    // Every ticker on its seeded synthetic series, no network
    std::vector<Ticker> synthesize() const;

    const std::vector<CatalogEntry>& catalog() const { return catalog_; }

private:
    std::vector<CatalogEntry> catalog_;
    std::shared_ptr<MarketDataSource> source_;
    int concurrency_;
    uint64_t seed_;

    Ticker load_one(const CatalogEntry& entry, const CancelToken& token) const;
};

struct UniverseSnapshot {
    std::vector<Ticker> tickers;
    std::string refreshed_at;

    int synthetic_count() const;
    std::vector<Ticker> filter(const std::vector<std::string>& sectors) const {
        return filter_by_sectors(tickers, sectors);
    }
};

using UniverseSnapshotPtr = std::shared_ptr<const UniverseSnapshot>;

// Holds the current immutable snapshot. Readers copy the pointer and keep it
// for the whole request; refresh builds a new snapshot and swaps it in.
class CatalogStore {
public:
    explicit CatalogStore(std::shared_ptr<CandidateUniverse> universe);

    UniverseSnapshotPtr snapshot() const;
    void publish(UniverseSnapshotPtr snapshot);

    // On cancellation the previous snapshot stays in place
    void refresh(const CancelToken& token);

    // Loads inline only when nothing has been published yet. Waits for a
    // running refresh no longer than the token's deadline, then answers with
    // an unpublished synthetic snapshot. A load that outlives the deadline is
    // returned to the caller but never published.
    UniverseSnapshotPtr ensure_loaded(const CancelToken& token);

private:
    std::shared_ptr<CandidateUniverse> universe_;
    mutable std::mutex mutex_;
    std::timed_mutex refresh_mutex_;
    UniverseSnapshotPtr current_;

    UniverseSnapshotPtr load_and_publish(const CancelToken& token);
    UniverseSnapshotPtr synthetic_snapshot() const;
};
