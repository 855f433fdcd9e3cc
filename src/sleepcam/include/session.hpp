#pragma once
#include <functional>
#include <optional>
#include <string>
#include "state_machine.hpp"

// Finalized record of one monitoring session. Times are seconds since epoch.
struct SleepSession {
    std::string id;              // assigned by the store
    double start_time = 0.0;
    double end_time = 0.0;
    double total_sleep_seconds = 0.0;
    double deep_sleep_seconds = 0.0;
    double light_sleep_seconds = 0.0;
    int wake_up_count = 0;
    int spasm_count = 0;
    int quality_score = 0;
    double avg_breathing_bpm = 0.0;
    std::string timeline;        // "<ms>:<state>,..."
};

struct SleepStats {
    SleepState current_state = SleepState::Unknown;
    bool breathing_detected = false;
    double breathing_rate_bpm = 0.0;
    int sleep_quality_score = 0;
    long total_sleep_seconds = 0;
    long deep_sleep_seconds = 0;
    long light_sleep_seconds = 0;
    int wake_ups = 0;
    int spasm_count = 0;
    SleepPhase sleep_phase = SleepPhase::Unknown;
    long session_duration_seconds = 0;
    double avg_breathing_bpm = 0.0;
};

// Inputs to the quality score.
struct SessionMetrics {
    double total_sleep = 0.0;
    double deep_sleep = 0.0;
    double light_sleep = 0.0;
    int wake_ups = 0;
    int spasms = 0;
    double duration = 0.0;
};

using QualityScorer = std::function<int(const SessionMetrics&)>;
using TimeSource = std::function<double()>;

// 0..100: deep-sleep ratio (40), wake-ups (30), spasms (15), efficiency (15).
int default_quality_score(const SessionMetrics& m);

// Storage collaborator; returns the id the session was stored under, or an
// empty string when it could not be stored.
class SessionStore {
public:
    virtual ~SessionStore() = default;
    virtual std::string save(const SleepSession& session) = 0;
};

// Owns the session lifecycle around one SleepStateMachine.
class SessionAggregator {
public:
    SessionAggregator(SessionStore* store, TimeSource clock,
                      const StateMachineSettings& settings = StateMachineSettings(),
                      const BreathingSettings& breathing = BreathingSettings());

    void set_quality_scorer(QualityScorer scorer) { scorer_ = std::move(scorer); }

    void start_session();
    SleepState update(double score);
    // `now` is the sample's own timestamp. Warm-up, timers and sleep time run
    // on these timestamps; the clock only stamps the record's start and end.
    SleepState update(double score, double now);
    // Returns the stored record, or nullopt when no session was running.
    std::optional<SleepSession> stop_session();

    bool session_running() const { return started_at_.has_value(); }
    SleepStats get_stats() const;
    SleepState current_state() const { return machine_.current(); }
    SleepStateMachine& state_machine() { return machine_; }
    const SleepStateMachine& state_machine() const { return machine_; }

private:
    SessionStore* store_;
    TimeSource clock_;
    QualityScorer scorer_;
    SleepStateMachine machine_;
    std::optional<double> started_at_;       // clock
    std::optional<double> last_update_;      // sample timestamps
    std::optional<double> first_sample_;
    double last_sample_ = 0.0;
    double last_sample_clock_ = 0.0;
    double total_sleep_ = 0.0;
    double deep_sleep_ = 0.0;
    double light_sleep_ = 0.0;
    double bpm_sum_ = 0.0;
    long bpm_samples_ = 0;

    void accumulate(double now);
    double sample_time(double clock_now) const;
    SessionMetrics metrics(double clock_now) const;
    std::string timeline_string() const;
};
