#include "frame_gate.hpp"
#include "log.hpp"

static const char* TAG = "FrameGate";

FrameGate::FrameGate(const FrameGateSettings& settings) : settings_(settings) {}

double FrameGate::rescale(double score, int width, int height, double reference_area) {
    const double area = double(width) * height;
    return area > 0 ? score * (reference_area / area) : score;
}

std::optional<double> FrameGate::admit(const MotionResult& result, double now) {
    if (result.score == 0.0) {
        zero_streak_++;
        if (settings_.suppress_duplicates && last_nonzero_score_ > 0.0 &&
            (now - last_nonzero_time_) < settings_.duplicate_window &&
            zero_streak_ < settings_.min_zero_streak) {
            dropped_++;
            log_msg(LogLevel::Debug, TAG, "duplicate frame skipped (zero streak %d, last non-zero %.0f)",
                    zero_streak_, last_nonzero_score_);
            return std::nullopt;
        }
    } else {
        last_nonzero_score_ = result.score;
        last_nonzero_time_ = now;
        zero_streak_ = 0;
    }
    admitted_++;
    return rescale(result.score, result.width, result.height, settings_.reference_area);
}

void FrameGate::reset() {
    last_nonzero_score_ = 0.0;
    last_nonzero_time_ = 0.0;
    zero_streak_ = 0;
    admitted_ = 0;
    dropped_ = 0;
}
