#pragma once
#include <deque>
#include <functional>
#include <optional>
#include <utility>
#include <vector>
#include "breathing.hpp"
#include "config.hpp"
#include "sleep_state.hpp"

struct StateMachineSettings {
    double no_motion_threshold = cfg::NO_MOTION_THRESHOLD;
    double high_motion_threshold = cfg::HIGH_MOTION_THRESHOLD;
    double deep_motion_min = cfg::DEEP_MOTION_MIN;
    double deep_motion_max = cfg::DEEP_MOTION_MAX;
    double rem_motion_min = cfg::REM_MOTION_MIN;
    double rem_motion_max = cfg::REM_MOTION_MAX;
    double deep_bpm_min = cfg::DEEP_BPM_MIN;
    double deep_bpm_max = cfg::DEEP_BPM_MAX;
    double rem_bpm_min = cfg::REM_BPM_MIN;
    double rem_bpm_max = cfg::REM_BPM_MAX;
    double quiet_ceiling = cfg::QUIET_CEILING;
    double buffer_seconds = cfg::BUFFER_SECONDS;
    double analysis_window = cfg::ANALYSIS_WINDOW;
    double spike_window = cfg::SPIKE_WINDOW;
    double quiet_window = cfg::QUIET_WINDOW;
    double warmup_seconds = cfg::WARMUP_SECONDS;
    double confirm_alarm = cfg::CONFIRM_ALARM;
    double confirm_awake = cfg::CONFIRM_AWAKE;
    double confirm_spasm = cfg::CONFIRM_SPASM;
    double confirm_other = cfg::CONFIRM_OTHER;
};

// Statistics over the rolling motion buffer at one instant.
struct MotionStats {
    double mean = 0.0;         // analysis window
    double recent_mean = 0.0;  // spike window
    double recent_max = 0.0;   // spike window
    double max30 = 0.0;        // quiet window
    double bpm = 0.0;
    double variability = 0.0;
};

struct StateChange {
    double timestamp;
    SleepState from;
    SleepState to;
};

// Hysteresis-gated classifier. One writer only; every method takes the
// caller's notion of "now" so tests can drive time directly.
class SleepStateMachine {
public:
    using TransitionListener = std::function<void(const StateChange&)>;

    explicit SleepStateMachine(const StateMachineSettings& settings = StateMachineSettings(),
                               const BreathingSettings& breathing = BreathingSettings());

    // Enters Calibrating; nothing else is reported until warm-up has passed.
    void begin(double now);
    // Same, but warm-up is timed from the first sample's timestamp, so the
    // caller's clock and the sample timestamps need not share a base.
    void begin();
    void reset();

    // Warm-up check, then push_sample() + evaluate().
    SleepState update(double score, double now);

    void push_sample(double score, double now);
    // Classifies from the buffer. No-op on an empty buffer.
    SleepState evaluate(double now);
    std::optional<MotionStats> analyze(double now) const;

    SleepState current() const { return current_; }
    std::optional<SleepState> pending() const { return pending_; }
    bool in_warmup(double now) const;
    int wake_ups() const { return wake_ups_; }
    int spasm_count() const { return spasm_count_; }
    const std::vector<StateChange>& timeline() const { return timeline_; }
    const BreathingAnalyzer& breathing() const { return breathing_; }
    size_t buffered_samples() const { return buffer_.size(); }

    void set_transition_listener(TransitionListener l) { listener_ = std::move(l); }

private:
    StateMachineSettings settings_;
    BreathingAnalyzer breathing_;
    std::deque<std::pair<double, double>> buffer_;  // (timestamp, score)
    SleepState current_ = SleepState::Unknown;
    std::optional<double> started_at_;
    double state_since_ = 0.0;
    std::optional<SleepState> pending_;
    double pending_since_ = 0.0;
    bool was_sleeping_ = false;
    int wake_ups_ = 0;
    int spasm_count_ = 0;
    std::vector<StateChange> timeline_;
    TransitionListener listener_;

    void trim_buffer(double now);
    SleepState target_state(const MotionStats& s) const;
    double confirm_time(SleepState target) const;
    void handle_transition(SleepState target, double now);
    void execute_transition(SleepState next, double now);
    void record_change(const StateChange& change);
};
