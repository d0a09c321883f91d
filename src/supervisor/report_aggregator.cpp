#include "supervisor/report_aggregator.hpp"

using json = nlohmann::json;

namespace mycelium::supervisor {

json AggregateSummary::to_json() const {
    json j;
    j["count"] = count;
    j["successes"] = successes;
    j["failures"] = failures;
    j["success_rate"] = success_rate;
    j["avg_latency_ms"] = avg_latency_ms;
    j["window_ms"] = window_ms;
    return j;
}

AggregateSummary AggregateSummary::from_json(const json& j) {
    AggregateSummary summary;
    summary.count = j.value("count", uint64_t{0});
    summary.successes = j.value("successes", uint64_t{0});
    summary.failures = j.value("failures", uint64_t{0});
    summary.success_rate = j.value("success_rate", 1.0);
    summary.avg_latency_ms = j.value("avg_latency_ms", 0.0);
    summary.window_ms = j.value("window_ms", int64_t{0});
    return summary;
}

ReportAggregator::ReportAggregator(AggregationConfig config, util::TimePoint start)
    : config_(config)
    , window_start_(start) {}

void ReportAggregator::record(bool success, int64_t latency_ms) {
    window_count_++;
    total_count_++;
    if (success) {
        window_successes_++;
        total_successes_++;
    }
    window_latency_sum_ += latency_ms > 0 ? latency_ms : 0;
}

bool ReportAggregator::due(util::TimePoint now) const {
    if (config_.every_n_reports > 0 && window_count_ >= config_.every_n_reports) {
        return true;
    }
    if (util::elapsed_ms(window_start_, now) < config_.window_ms) {
        return false;
    }
    return window_count_ > 0 || config_.keepalive;
}

AggregateSummary ReportAggregator::flush(util::TimePoint now) {
    AggregateSummary summary;
    summary.count = window_count_;
    summary.successes = window_successes_;
    summary.failures = window_count_ - window_successes_;
    if (window_count_ > 0) {
        summary.success_rate = static_cast<double>(window_successes_) / static_cast<double>(window_count_);
        summary.avg_latency_ms = static_cast<double>(window_latency_sum_) / static_cast<double>(window_count_);
    }
    summary.window_ms = util::elapsed_ms(window_start_, now);

    window_start_ = now;
    window_count_ = 0;
    window_successes_ = 0;
    window_latency_sum_ = 0;
    return summary;
}

} // namespace mycelium::supervisor
