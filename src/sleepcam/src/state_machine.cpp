#include "state_machine.hpp"
#include "log.hpp"
#include <algorithm>

static const char* TAG = "SleepStateMachine";

static bool in_range(double v, double lo, double hi) { return v >= lo && v <= hi; }

SleepStateMachine::SleepStateMachine(const StateMachineSettings& settings,
                                     const BreathingSettings& breathing)
    : settings_(settings), breathing_(breathing) {}

void SleepStateMachine::reset() {
    breathing_.reset();
    buffer_.clear();
    current_ = SleepState::Unknown;
    started_at_.reset();
    state_since_ = 0.0;
    pending_.reset();
    pending_since_ = 0.0;
    was_sleeping_ = false;
    wake_ups_ = 0;
    spasm_count_ = 0;
    timeline_.clear();
}

void SleepStateMachine::begin(double now) {
    reset();
    started_at_ = now;
    execute_transition(SleepState::Calibrating, now);
}

void SleepStateMachine::begin() {
    reset();
    current_ = SleepState::Calibrating;
}

bool SleepStateMachine::in_warmup(double now) const {
    if (!started_at_) return current_ == SleepState::Calibrating;
    return (now - *started_at_) < settings_.warmup_seconds;
}

SleepState SleepStateMachine::update(double score, double now) {
    if (!started_at_ && current_ == SleepState::Calibrating) {
        started_at_ = now;
        state_since_ = now;
        record_change(StateChange{now, SleepState::Unknown, SleepState::Calibrating});
    }
    if (in_warmup(now)) {
        log_msg(LogLevel::Debug, TAG, "calibrating... %.1fs", now - *started_at_);
        return current_;
    }
    push_sample(score, now);
    return evaluate(now);
}

void SleepStateMachine::push_sample(double score, double now) {
    buffer_.emplace_back(now, score);
    trim_buffer(now);
    breathing_.process_motion(score, now);
}

void SleepStateMachine::trim_buffer(double now) {
    const double cutoff = now - settings_.buffer_seconds;
    while (!buffer_.empty() && buffer_.front().first < cutoff)
        buffer_.pop_front();
}

std::optional<MotionStats> SleepStateMachine::analyze(double now) const {
    if (buffer_.empty()) return std::nullopt;

    const double window_start = now - settings_.analysis_window;
    const double spike_start = now - settings_.spike_window;
    const double quiet_start = now - settings_.quiet_window;

    double window_sum = 0.0, recent_sum = 0.0;
    size_t window_n = 0, recent_n = 0;
    MotionStats s;
    for (const auto& [t, score] : buffer_) {
        if (t >= window_start) { window_sum += score; window_n++; }
        if (t >= spike_start) {
            recent_sum += score;
            recent_n++;
            s.recent_max = std::max(s.recent_max, score);
        }
        if (t >= quiet_start) s.max30 = std::max(s.max30, score);
    }
    if (window_n == 0) return std::nullopt;

    s.mean = window_sum / window_n;
    s.recent_mean = recent_n ? recent_sum / recent_n : 0.0;
    s.bpm = breathing_.breathing_rate(now);
    s.variability = breathing_.variability(now);
    return s;
}

SleepState SleepStateMachine::evaluate(double now) {
    trim_buffer(now);
    std::optional<MotionStats> stats = analyze(now);
    if (!stats) return current_;

    log_msg(LogLevel::Debug, TAG,
            "mean=%.0f recentMax=%.0f max30=%.0f bpm=%.1f var=%.3f",
            stats->mean, stats->recent_max, stats->max30, stats->bpm, stats->variability);

    handle_transition(target_state(*stats), now);
    return current_;
}

SleepState SleepStateMachine::target_state(const MotionStats& s) const {
    const BreathingSettings& b = breathing_.settings();

    if (s.recent_max > settings_.high_motion_threshold) {
        // Sustained high motion is promoted from Spasm to Awake in handle_transition().
        return current_ == SleepState::Awake ? SleepState::Awake : SleepState::Spasm;
    }

    if (s.mean < settings_.no_motion_threshold && s.bpm == 0.0)
        return SleepState::NoBreathing;

    bool rem_motion = in_range(s.mean, settings_.rem_motion_min, settings_.rem_motion_max);
    bool rem_bpm = in_range(s.bpm, settings_.rem_bpm_min, settings_.rem_bpm_max) &&
                   s.variability > b.high_variability;
    if (rem_motion || rem_bpm)
        return SleepState::RemSleep;

    bool deep_motion = in_range(s.mean, settings_.deep_motion_min, settings_.deep_motion_max);
    bool deep_bpm = in_range(s.bpm, settings_.deep_bpm_min, settings_.deep_bpm_max) &&
                    s.variability < b.low_variability;
    bool quiet = s.max30 < settings_.quiet_ceiling;
    if ((deep_motion || deep_bpm) && quiet)
        return SleepState::DeepSleep;

    return is_sleep_like(current_) ? current_ : SleepState::LightSleep;
}

double SleepStateMachine::confirm_time(SleepState target) const {
    if (current_ == SleepState::Calibrating) return 0.0;
    switch (target) {
    case SleepState::NoBreathing: return settings_.confirm_alarm;
    case SleepState::Awake:       return settings_.confirm_awake;
    case SleepState::Spasm:       return settings_.confirm_spasm;
    default:                      return settings_.confirm_other;
    }
}

void SleepStateMachine::handle_transition(SleepState target, double now) {
    if (target == current_) {
        if (current_ == SleepState::Spasm && (now - state_since_) > settings_.confirm_awake)
            execute_transition(SleepState::Awake, now);
        pending_.reset();
        return;
    }

    const double confirm = confirm_time(target);
    if (pending_ != target) {
        pending_ = target;
        pending_since_ = now;
        log_msg(LogLevel::Debug, TAG, "pending %s, confirming for %.1fs", to_string(target), confirm);
    }
    if (now - pending_since_ >= confirm)
        execute_transition(target, now);
}

void SleepStateMachine::execute_transition(SleepState next, double now) {
    StateChange change{now, current_, next};
    current_ = next;
    state_since_ = now;
    pending_.reset();

    if (next == SleepState::Spasm) {
        spasm_count_++;
        log_msg(LogLevel::Info, TAG, "spasm detected, count %d", spasm_count_);
    }

    if (next == SleepState::Awake) {
        if (was_sleeping_) {
            wake_ups_++;
            was_sleeping_ = false;
            log_msg(LogLevel::Info, TAG, "wake-up detected, count %d", wake_ups_);
        }
    } else if (is_sleep_like(next)) {
        was_sleeping_ = true;
    }

    record_change(change);
}

void SleepStateMachine::record_change(const StateChange& change) {
    timeline_.push_back(change);
    log_msg(LogLevel::Info, TAG, "transition %s -> %s", to_string(change.from), to_string(change.to));
    if (listener_) listener_(change);
}
