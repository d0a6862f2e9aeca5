#include "universe.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <unordered_set>

double Ticker::return_1y() const {
    double growth = 1.0;
    for (double r : returns) {
        growth *= (1.0 + r);
    }
    return growth - 1.0;
}

double Ticker::annualized_mean() const {
    if (returns.empty()) return 0.0;
    double sum = 0.0;
    for (double r : returns) sum += r;
    return sum / static_cast<double>(returns.size()) * 252.0;
}

const std::vector<CatalogEntry>& default_catalog() {
    static const std::vector<CatalogEntry> catalog = {
        {"AAPL", "Apple Inc.", "Technology"},
        {"MSFT", "Microsoft Corporation", "Technology"},
        {"GOOGL", "Alphabet Inc.", "Technology"},
        {"META", "Meta Platforms Inc.", "Technology"},
        {"NVDA", "NVIDIA Corporation", "Semiconductors"},
        {"AMD", "Advanced Micro Devices", "Semiconductors"},
        {"TSM", "Taiwan Semiconductor", "Semiconductors"},
        {"PLTR", "Palantir Technologies", "AI"},
        {"TSLA", "Tesla Inc.", "Growth"},
        {"AMZN", "Amazon.com Inc.", "Growth"},
        {"COIN", "Coinbase Global", "Crypto"},
        {"IBIT", "iShares Bitcoin Trust", "Crypto"},
        {"GLD", "SPDR Gold Shares", "Gold"},
        {"GDX", "VanEck Gold Miners ETF", "Gold"},
        {"NEM", "Newmont Corporation", "Gold"},
        {"XLU", "Utilities Select Sector SPDR", "Utilities"},
        {"NEE", "NextEra Energy", "Utilities"},
        {"DUK", "Duke Energy", "Utilities"},
        {"TLT", "iShares 20+ Year Treasury Bond ETF", "Bonds"},
        {"IEF", "iShares 7-10 Year Treasury Bond ETF", "Bonds"},
        {"BND", "Vanguard Total Bond Market ETF", "Bonds"},
        {"KO", "The Coca-Cola Company", "Consumer Staples"},
        {"PG", "Procter & Gamble", "Consumer Staples"},
        {"PEP", "PepsiCo Inc.", "Consumer Staples"},
        {"JNJ", "Johnson & Johnson", "Healthcare"},
        {"UNH", "UnitedHealth Group", "Healthcare"},
        {"XOM", "Exxon Mobil", "Energy"},
        {"CVX", "Chevron Corporation", "Energy"},
        {"JPM", "JPMorgan Chase & Co.", "Financials"},
        {"GS", "Goldman Sachs Group", "Financials"},
        {"SPY", "SPDR S&P 500 ETF", "Broad Market"},
        {"QQQ", "Invesco QQQ Trust", "Broad Market"},
        {"DIA", "SPDR Dow Jones Industrial Average ETF", "Broad Market"},
        {"IWM", "iShares Russell 2000 ETF", "Broad Market"},
        {"VT", "Vanguard Total World Stock ETF", "Diversified"},
        {"AOR", "iShares Core Growth Allocation ETF", "Diversified"},
    };
    return catalog;
}

std::vector<Ticker> filter_by_sectors(const std::vector<Ticker>& universe,
                                      const std::vector<std::string>& sectors) {
    std::unordered_set<std::string> wanted(sectors.begin(), sectors.end());

    std::vector<Ticker> matched;
    for (const auto& t : universe) {
        if (wanted.count(t.sector)) {
            matched.push_back(t);
        }
    }

    if (matched.empty()) {
        spdlog::debug("No tickers match sector tilt, using full universe of {}", universe.size());
        return universe;
    }
    return matched;
}

CandidateUniverse::CandidateUniverse(std::vector<CatalogEntry> catalog,
                                     std::shared_ptr<MarketDataSource> source,
                                     int concurrency,
                                     uint64_t seed)
    : catalog_(std::move(catalog))
    , source_(std::move(source))
    , concurrency_(std::max(1, concurrency))
    , seed_(seed)
{}

Ticker CandidateUniverse::load_one(const CatalogEntry& entry, const CancelToken& token) const {
    Ticker ticker{entry.symbol, entry.name, entry.sector, {}, false};

    token.throw_if_cancelled();
    try {
        ticker.returns = source_->fetch_daily_returns(entry.symbol, token);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("Market data unavailable for {}, using synthetic series: {}",
                     entry.symbol, e.what());
        ticker.returns = synthesize_returns(entry.symbol, entry.sector, seed_);
        ticker.synthetic = true;
    }

    return ticker;
}

std::vector<Ticker> CandidateUniverse::load(const CancelToken& token) const {
    std::vector<Ticker> tickers(catalog_.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> cancelled{false};

    auto worker = [&]() {
        while (!cancelled) {
            size_t i = next.fetch_add(1);
            if (i >= catalog_.size()) return;
            try {
                tickers[i] = load_one(catalog_[i], token);
            } catch (const CancelledError&) {
                cancelled = true;
            }
        }
    };

    size_t n_workers = std::min(static_cast<size_t>(concurrency_), catalog_.size());
    std::vector<std::thread> workers;
    for (size_t w = 0; w < n_workers; w++) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (cancelled) {
        throw CancelledError("Universe load cancelled");
    }

    int synthetic = 0;
    for (const auto& t : tickers) {
        if (t.synthetic) synthetic++;
    }
    spdlog::info("Loaded universe: {} tickers ({} synthetic)", tickers.size(), synthetic);

    return tickers;
}

std::vector<Ticker> CandidateUniverse::synthesize() const {
    std::vector<Ticker> tickers;
    tickers.reserve(catalog_.size());
    for (const auto& entry : catalog_) {
        tickers.push_back({entry.symbol, entry.name, entry.sector,
                           synthesize_returns(entry.symbol, entry.sector, seed_), true});
    }
    return tickers;
}

int UniverseSnapshot::synthetic_count() const {
    return static_cast<int>(std::count_if(tickers.begin(), tickers.end(),
                                          [](const Ticker& t) { return t.synthetic; }));
}

CatalogStore::CatalogStore(std::shared_ptr<CandidateUniverse> universe)
    : universe_(std::move(universe))
    , current_(std::make_shared<const UniverseSnapshot>())
{}

UniverseSnapshotPtr CatalogStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void CatalogStore::publish(UniverseSnapshotPtr snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(snapshot);
}

void CatalogStore::refresh(const CancelToken& token) {
    // Single writer; readers are never blocked by the load itself
    std::lock_guard<std::timed_mutex> writer(refresh_mutex_);
    load_and_publish(token);
}

UniverseSnapshotPtr CatalogStore::ensure_loaded(const CancelToken& token) {
    std::unique_lock<std::timed_mutex> writer(refresh_mutex_, std::defer_lock);
    auto budget = token.remaining();
    if (budget == std::chrono::milliseconds::max()) {
        writer.lock();
    } else if (!writer.try_lock_for(budget)) {
        spdlog::warn("Catalog refresh still running after {}ms, answering from synthetic series",
                     budget.count());
        return synthetic_snapshot();
    }

    // A concurrent refresh may have published while we waited for the lock
    auto current = snapshot();
    if (!current->tickers.empty()) {
        return current;
    }
    return load_and_publish(token);
}

UniverseSnapshotPtr CatalogStore::load_and_publish(const CancelToken& token) {
    auto next = std::make_shared<UniverseSnapshot>();
    next->tickers = universe_->load(token);
    next->refreshed_at = util::current_iso8601();

    int synthetic = next->synthetic_count();
    size_t size = next->tickers.size();

    // Fetches after the deadline degrade to synthetic series; keep that out
    // of the shared catalog
    if (token.expired()) {
        spdlog::warn("Catalog load overran its deadline ({} of {} synthetic), not publishing",
                     synthetic, size);
        return next;
    }

    publish(next);
    spdlog::info("Catalog snapshot refreshed: {} tickers, {} synthetic", size, synthetic);
    return next;
}

UniverseSnapshotPtr CatalogStore::synthetic_snapshot() const {
    auto snap = std::make_shared<UniverseSnapshot>();
    snap->tickers = universe_->synthesize();
    snap->refreshed_at = util::current_iso8601();
    return snap;
}
