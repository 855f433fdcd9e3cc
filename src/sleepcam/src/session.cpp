#include "session.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

static const char* TAG = "SessionAggregator";

int default_quality_score(const SessionMetrics& m) {
    if (m.total_sleep <= 0 || m.duration <= 0) return 0;

    const double deep_ratio = m.deep_sleep / m.total_sleep;
    double deep_score;
    if (deep_ratio >= 0.30 && deep_ratio <= 0.50)      deep_score = 40.0;  // ideal
    else if (deep_ratio >= 0.20 && deep_ratio < 0.30)  deep_score = 30.0;
    else if (deep_ratio > 0.50 && deep_ratio <= 0.60)  deep_score = 35.0;
    else if (deep_ratio >= 0.10 && deep_ratio < 0.20)  deep_score = 20.0;
    else if (deep_ratio > 0.60)                        deep_score = 25.0;
    else                                               deep_score = 10.0;

    double wake_score = std::max(0.0, 30.0 - m.wake_ups * 8.0);
    double spasm_score = std::max(0.0, 15.0 - m.spasms * 3.0);
    double efficiency_score = std::min(15.0, (m.total_sleep / m.duration) * 15.0);

    int total = static_cast<int>(deep_score + wake_score + spasm_score + efficiency_score);
    return std::clamp(total, 0, 100);
}

SessionAggregator::SessionAggregator(SessionStore* store, TimeSource clock,
                                     const StateMachineSettings& settings,
                                     const BreathingSettings& breathing)
    : store_(store), clock_(std::move(clock)), scorer_(default_quality_score),
      machine_(settings, breathing) {}

void SessionAggregator::start_session() {
    const double now = clock_();
    if (started_at_)
        log_msg(LogLevel::Warning, TAG, "start_session() while running, previous session discarded");

    machine_.begin();
    started_at_ = now;
    last_update_.reset();
    first_sample_.reset();
    total_sleep_ = deep_sleep_ = light_sleep_ = 0.0;
    bpm_sum_ = 0.0;
    bpm_samples_ = 0;
    log_msg(LogLevel::Info, TAG, "session started");
}

SleepState SessionAggregator::update(double score) {
    return update(score, clock_());
}

SleepState SessionAggregator::update(double score, double now) {
    if (!started_at_) {
        log_msg(LogLevel::Debug, TAG, "update without an active session ignored");
        return machine_.current();
    }

    if (!first_sample_) first_sample_ = now;
    last_sample_ = now;
    last_sample_clock_ = clock_();

    bool warmup = machine_.in_warmup(now);
    SleepState state = machine_.update(score, now);
    if (!warmup) accumulate(now);
    return state;
}

void SessionAggregator::accumulate(double now) {
    if (last_update_) {
        const double delta = std::max(0.0, now - *last_update_);
        switch (machine_.current()) {
        case SleepState::DeepSleep:
            total_sleep_ += delta;
            deep_sleep_ += delta;
            break;
        case SleepState::LightSleep:
        case SleepState::RemSleep:
            total_sleep_ += delta;
            light_sleep_ += delta;
            break;
        default:
            break;
        }
    }
    last_update_ = now;

    double bpm = machine_.breathing().breathing_rate(now);
    if (bpm > 0) {
        bpm_sum_ += bpm;
        bpm_samples_++;
    }
}

// Maps the clock onto the sample timestamps: the last sample plus the clock
// time that has passed since it arrived.
double SessionAggregator::sample_time(double clock_now) const {
    if (!first_sample_) return clock_now;
    return last_sample_ + std::max(0.0, clock_now - last_sample_clock_);
}

SessionMetrics SessionAggregator::metrics(double clock_now) const {
    SessionMetrics m;
    m.total_sleep = total_sleep_;
    m.deep_sleep = deep_sleep_;
    m.light_sleep = light_sleep_;
    m.wake_ups = machine_.wake_ups();
    m.spasms = machine_.spasm_count();
    if (first_sample_)
        m.duration = std::floor(sample_time(clock_now) - *first_sample_);
    else if (started_at_)
        m.duration = std::max(0.0, std::floor(clock_now - *started_at_));
    return m;
}

std::string SessionAggregator::timeline_string() const {
    std::ostringstream oss;
    bool first = true;
    for (const StateChange& c : machine_.timeline()) {
        if (!first) oss << ',';
        oss << static_cast<long long>(c.timestamp * 1000) << ':' << to_string(c.to);
        first = false;
    }
    return oss.str();
}

std::optional<SleepSession> SessionAggregator::stop_session() {
    if (!started_at_) {
        log_msg(LogLevel::Warning, TAG, "stop_session() called but no session is running");
        return std::nullopt;
    }

    const double now = clock_();
    SleepSession s;
    s.start_time = *started_at_;
    s.end_time = now;
    s.total_sleep_seconds = total_sleep_;
    s.deep_sleep_seconds = deep_sleep_;
    s.light_sleep_seconds = light_sleep_;
    s.wake_up_count = machine_.wake_ups();
    s.spasm_count = machine_.spasm_count();
    s.quality_score = scorer_ ? scorer_(metrics(now)) : 0;
    s.avg_breathing_bpm = bpm_samples_ > 0 ? bpm_sum_ / bpm_samples_ : 0.0;
    s.timeline = timeline_string();

    log_msg(LogLevel::Info, TAG,
            "session stopped after %lds: sleep=%lds deep=%lds light=%lds wakeUps=%d spasms=%d quality=%d avgBpm=%.1f",
            static_cast<long>(now - s.start_time), static_cast<long>(s.total_sleep_seconds),
            static_cast<long>(s.deep_sleep_seconds), static_cast<long>(s.light_sleep_seconds),
            s.wake_up_count, s.spasm_count, s.quality_score, s.avg_breathing_bpm);

    // Closed before the store sees it; a second stop is a no-op.
    started_at_.reset();
    last_update_.reset();
    first_sample_.reset();
    machine_.reset();

    if (store_) {
        s.id = store_->save(s);
        if (s.id.empty())
            log_msg(LogLevel::Error, TAG, "session could not be stored");
        else
            log_msg(LogLevel::Info, TAG, "session stored as %s", s.id.c_str());
    }
    return s;
}

SleepStats SessionAggregator::get_stats() const {
    const double now = clock_();
    SleepStats st;
    st.current_state = machine_.current();
    st.breathing_detected = st.current_state == SleepState::DeepSleep ||
                            st.current_state == SleepState::LightSleep;
    const double t = sample_time(now);
    st.breathing_rate_bpm = machine_.breathing().breathing_rate(t);
    SessionMetrics m = metrics(now);
    st.sleep_quality_score = scorer_ ? scorer_(m) : 0;
    st.total_sleep_seconds = static_cast<long>(total_sleep_);
    st.deep_sleep_seconds = static_cast<long>(deep_sleep_);
    st.light_sleep_seconds = static_cast<long>(light_sleep_);
    st.wake_ups = m.wake_ups;
    st.spasm_count = m.spasms;
    st.sleep_phase = machine_.breathing().sleep_phase(t);
    st.session_duration_seconds = static_cast<long>(m.duration);
    st.avg_breathing_bpm = bpm_samples_ > 0 ? bpm_sum_ / bpm_samples_ : 0.0;
    return st;
}
