#pragma once

#include "../src/economic.hpp"
#include "../src/errors.hpp"
#include "../src/market_data.hpp"
#include "../src/narrative.hpp"
#include "../src/news_client.hpp"
#include "../src/universe.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <random>
#include <string>
#include <vector>

// Serves the seeded sector-calibrated walk for every catalog symbol
class StubMarketSource : public MarketDataSource {
public:
    explicit StubMarketSource(uint64_t seed = 7) : seed_(seed) {}

    std::vector<double> fetch_daily_returns(const std::string& symbol,
                                            const CancelToken& token) override {
        (void)token;
        calls++;
        std::string sector = "Broad Market";
        for (const auto& e : default_catalog()) {
            if (e.symbol == symbol) sector = e.sector;
        }
        return synthesize_returns(symbol, sector, seed_);
    }

    std::atomic<int> calls{0};

private:
    uint64_t seed_;
};

// Fails like HttpClient does once the request deadline has passed
class DeadlineBoundMarketSource : public MarketDataSource {
public:
    std::vector<double> fetch_daily_returns(const std::string& symbol,
                                            const CancelToken& token) override {
        if (token.expired()) {
            throw DataUnavailableError("Deadline exceeded before fetching " + symbol);
        }
        return inner_.fetch_daily_returns(symbol, token);
    }

private:
    StubMarketSource inner_;
};

// Blocks callers until release(); wait() gives up after `limit`
class Gate {
public:
    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

    void wait(std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, limit, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

// Polls `done` for up to `limit`; returns its final value
template <typename Pred>
bool eventually(Pred done, std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
    auto until = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= until) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

// Serves stub data, but every fetch waits on the gate first
class GatedMarketSource : public MarketDataSource {
public:
    std::vector<double> fetch_daily_returns(const std::string& symbol,
                                            const CancelToken& token) override {
        entered++;
        gate.wait();
        return inner_.fetch_daily_returns(symbol, token);
    }

    Gate gate;
    std::atomic<int> entered{0};

private:
    StubMarketSource inner_;
};

class FailingMarketSource : public MarketDataSource {
public:
    std::vector<double> fetch_daily_returns(const std::string& symbol,
                                            const CancelToken& token) override {
        (void)token;
        throw DataUnavailableError("upstream down for " + symbol);
    }
};

class StubNewsSource : public NewsSource {
public:
    explicit StubNewsSource(std::vector<std::string> headlines) : headlines_(std::move(headlines)) {}

    std::vector<std::string> fetch_headlines(int limit, const CancelToken& token) override {
        (void)token;
        std::vector<std::string> out;
        for (const auto& h : headlines_) {
            if (static_cast<int>(out.size()) >= limit) break;
            out.push_back(h);
        }
        return out;
    }

private:
    std::vector<std::string> headlines_;
};

class FailingNewsSource : public NewsSource {
public:
    std::vector<std::string> fetch_headlines(int limit, const CancelToken& token) override {
        (void)limit;
        (void)token;
        throw DataUnavailableError("news upstream down");
    }
};

class StubEconomicSource : public EconomicDataSource {
public:
    explicit StubEconomicSource(EconomicIndicators values) : values_(values) {}

    EconomicIndicators fetch(const CancelToken& token) override {
        (void)token;
        calls++;
        return values_;
    }

    int calls = 0;

private:
    EconomicIndicators values_;
};

// Records how many fetches overlap while they wait on the gate
class GatedEconomicSource : public EconomicDataSource {
public:
    explicit GatedEconomicSource(EconomicIndicators values) : values_(values) {}

    EconomicIndicators fetch(const CancelToken& token) override {
        (void)token;
        int now = ++in_flight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        gate.wait();
        in_flight--;
        return values_;
    }

    Gate gate;
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};

private:
    EconomicIndicators values_;
};

class StubNarrativeAnalyzer : public NarrativeAnalyzer {
public:
    explicit StubNarrativeAnalyzer(NarrativeView view) : view_(std::move(view)) {}

    NarrativeView analyze(const std::string& text, const CancelToken& token) override {
        (void)text;
        (void)token;
        calls++;
        return view_;
    }

    std::atomic<int> calls{0};

private:
    NarrativeView view_;
};

class FailingNarrativeAnalyzer : public NarrativeAnalyzer {
public:
    NarrativeView analyze(const std::string& text, const CancelToken& token) override {
        (void)text;
        (void)token;
        throw DataUnavailableError("model upstream down");
    }
};

// A defect rather than an upstream outage
class BrokenNarrativeAnalyzer : public NarrativeAnalyzer {
public:
    NarrativeView analyze(const std::string& text, const CancelToken& token) override {
        (void)text;
        (void)token;
        throw InternalError("model adapter state corrupted");
    }
};

// Holds the request until its token is cancelled
class StallingNarrativeAnalyzer : public NarrativeAnalyzer {
public:
    NarrativeView analyze(const std::string& text, const CancelToken& token) override {
        (void)text;
        entered = true;
        eventually([&token] { return token.cancelled(); });
        token.throw_if_cancelled();
        throw DataUnavailableError("stalled without cancellation");
    }

    std::atomic<bool> entered{false};
};

// Daily returns with the given annualized drift and volatility
inline std::vector<double> make_returns(double annual_mu, double annual_sigma,
                                        uint64_t seed, int days = 252) {
    std::mt19937_64 gen(seed);
    std::normal_distribution<double> dist(annual_mu / 252.0, annual_sigma / std::sqrt(252.0));
    std::vector<double> out;
    for (int i = 0; i < days; i++) out.push_back(dist(gen));
    return out;
}

inline Ticker make_ticker(const std::string& symbol, const std::string& sector,
                          std::vector<double> returns) {
    return Ticker{symbol, symbol + " Inc.", sector, std::move(returns), false};
}
