#pragma once
#include <deque>
#include <optional>
#include <string>
#include "config.hpp"

struct BreathingSettings {
    double peak_threshold = cfg::BREATH_PEAK_THRESHOLD;
    double min_interval = cfg::MIN_BREATH_INTERVAL;
    double max_interval = cfg::MAX_BREATH_INTERVAL;
    size_t history = cfg::BREATH_HISTORY;
    size_t rate_window = cfg::RATE_WINDOW;
    size_t variability_window = cfg::VARIABILITY_WINDOW;
    size_t min_rate_intervals = cfg::MIN_RATE_INTERVALS;
    size_t min_variability_intervals = cfg::MIN_VARIABILITY_INTERVALS;
    double decay_timeout = cfg::BPM_DECAY_TIMEOUT;
    double low_variability = cfg::LOW_VARIABILITY;
    double high_variability = cfg::HIGH_VARIABILITY;
};

enum class SleepPhase { Unknown, Deep, Transitional, Light };
const char* to_string(SleepPhase p);

// Threshold-crossing breath detector over the motion score series.
class BreathingAnalyzer {
public:
    explicit BreathingAnalyzer(const BreathingSettings& settings = BreathingSettings());

    // Returns the accepted interval (seconds) when this sample starts a new
    // peak at a plausible distance from the previous one.
    std::optional<double> process_motion(double score, double timestamp);

    // Both decay to 0 once `now` is more than decay_timeout past the last
    // accepted breath, whatever the history holds.
    double breathing_rate(double now) const;
    double variability(double now) const;
    SleepPhase sleep_phase(double now) const;

    size_t interval_count() const { return intervals_.size(); }
    int breath_count() const { return breaths_; }
    const BreathingSettings& settings() const { return settings_; }

    void reset();

private:
    BreathingSettings settings_;
    std::deque<double> intervals_;
    std::optional<double> last_peak_;
    std::optional<double> last_breath_;
    bool in_peak_ = false;
    int breaths_ = 0;

    bool stale(double now) const;
};

double mean_of(const std::deque<double>& v, size_t last_n);
double stddev_of(const std::deque<double>& v, size_t last_n);  // sample std-dev
