#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include "util/clock.hpp"

namespace mycelium::supervisor {

struct AggregationConfig {
    uint32_t every_n_reports = 10;   // flush after this many child reports
    int64_t window_ms = 5000;        // or when this much time has passed
    bool keepalive = true;           // flush empty windows too
};

struct AggregateSummary {
    uint64_t count = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    double success_rate = 1.0;
    double avg_latency_ms = 0.0;
    int64_t window_ms = 0;

    nlohmann::json to_json() const;
    static AggregateSummary from_json(const nlohmann::json& j);
};

// Compresses child reports into periodic summaries
class ReportAggregator {
public:
    ReportAggregator(AggregationConfig config, util::TimePoint start);

    void record(bool success, int64_t latency_ms);
    bool due(util::TimePoint now) const;
    AggregateSummary flush(util::TimePoint now);

    uint64_t pending_count() const { return window_count_; }
    uint64_t total_count() const { return total_count_; }
    uint64_t total_successes() const { return total_successes_; }
    uint64_t total_failures() const { return total_count_ - total_successes_; }

private:
    AggregationConfig config_;
    util::TimePoint window_start_;
    uint64_t window_count_ = 0;
    uint64_t window_successes_ = 0;
    int64_t window_latency_sum_ = 0;
    uint64_t total_count_ = 0;
    uint64_t total_successes_ = 0;
};

} // namespace mycelium::supervisor
