#include "breathing.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>

static const char* TAG = "BreathingAnalyzer";

const char* to_string(SleepPhase p) {
    switch (p) {
    case SleepPhase::Deep:         return "deep";
    case SleepPhase::Transitional: return "transitional";
    case SleepPhase::Light:        return "light";
    default:                       return "unknown";
    }
}

double mean_of(const std::deque<double>& v, size_t last_n) {
    size_t n = std::min(last_n, v.size());
    if (n == 0) return 0.0;
    double sum = 0.0;
    for (auto it = v.end() - n; it != v.end(); ++it) sum += *it;
    return sum / n;
}

double stddev_of(const std::deque<double>& v, size_t last_n) {
    size_t n = std::min(last_n, v.size());
    if (n < 2) return 0.0;
    double m = mean_of(v, n);
    double sq = 0.0;
    for (auto it = v.end() - n; it != v.end(); ++it) sq += (*it - m) * (*it - m);
    return std::sqrt(sq / (n - 1));
}

BreathingAnalyzer::BreathingAnalyzer(const BreathingSettings& settings)
    : settings_(settings) {}

std::optional<double> BreathingAnalyzer::process_motion(double score, double timestamp) {
    if (score <= settings_.peak_threshold) {
        in_peak_ = false;
        return std::nullopt;
    }
    if (in_peak_) return std::nullopt;
    in_peak_ = true;

    if (!last_peak_) {
        last_peak_ = timestamp;
        last_breath_ = timestamp;
        return std::nullopt;
    }

    double interval = timestamp - *last_peak_;
    last_peak_ = timestamp;
    if (interval < settings_.min_interval || interval > settings_.max_interval) {
        log_msg(LogLevel::Debug, TAG, "peak interval %.2fs outside breathing window", interval);
        return std::nullopt;
    }

    intervals_.push_back(interval);
    while (intervals_.size() > settings_.history) intervals_.pop_front();
    last_breath_ = timestamp;
    breaths_++;
    return interval;
}

bool BreathingAnalyzer::stale(double now) const {
    if (!last_breath_) return true;
    return (now - *last_breath_) > settings_.decay_timeout;
}

double BreathingAnalyzer::breathing_rate(double now) const {
    if (intervals_.size() < settings_.min_rate_intervals || stale(now)) return 0.0;
    double avg = mean_of(intervals_, settings_.rate_window);
    return avg > 0 ? 60.0 / avg : 0.0;
}

double BreathingAnalyzer::variability(double now) const {
    if (intervals_.size() < settings_.min_variability_intervals || stale(now)) return 0.0;
    double m = mean_of(intervals_, settings_.variability_window);
    if (m <= 0) return 0.0;
    return stddev_of(intervals_, settings_.variability_window) / m;
}

SleepPhase BreathingAnalyzer::sleep_phase(double now) const {
    double v = variability(now);
    if (v == 0.0) return SleepPhase::Unknown;
    if (v < settings_.low_variability) return SleepPhase::Deep;
    if (v > settings_.high_variability) return SleepPhase::Light;
    return SleepPhase::Transitional;
}

void BreathingAnalyzer::reset() {
    intervals_.clear();
    last_peak_.reset();
    last_breath_.reset();
    in_peak_ = false;
    breaths_ = 0;
}
