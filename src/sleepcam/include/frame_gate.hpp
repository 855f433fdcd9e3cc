#pragma once
#include <optional>
#include "config.hpp"
#include "motion.hpp"

struct FrameGateSettings {
    double reference_area = cfg::REFERENCE_AREA;
    double duplicate_window = cfg::DUPLICATE_WINDOW;  // seconds
    int min_zero_streak = cfg::MIN_ZERO_STREAK;
    bool suppress_duplicates = true;
};

// Sits between the detector and the state machine: drops zero scores that are
// really a decoder emitting the same frame twice, and rescales the rest to
// the reference frame area all thresholds are tuned for.
class FrameGate {
public:
    explicit FrameGate(const FrameGateSettings& settings = FrameGateSettings());

    std::optional<double> admit(const MotionResult& result, double now);
    void reset();

    static double rescale(double score, int width, int height, double reference_area);

    long admitted() const { return admitted_; }
    long dropped() const { return dropped_; }

private:
    FrameGateSettings settings_;
    double last_nonzero_score_ = 0.0;
    double last_nonzero_time_ = 0.0;
    int zero_streak_ = 0;
    long admitted_ = 0;
    long dropped_ = 0;
};
