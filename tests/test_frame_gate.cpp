/*
 * Frame gate tests
 * Duplicate-frame suppression and reference-area rescaling.
 */

#include "frame_gate.hpp"
#include "test_util.hpp"

static MotionResult full_hd(double score) { return MotionResult{score, 1920, 1080}; }

bool test_rescale_to_reference() {
    const double ref = 1920.0 * 1080.0;
    TEST_ASSERT(approx_eq(FrameGate::rescale(100.0, 960, 540, ref), 400.0), "Quarter area scales by four");
    TEST_ASSERT(approx_eq(FrameGate::rescale(100.0, 1920, 1080, ref), 100.0), "Reference size unchanged");
    TEST_ASSERT(approx_eq(FrameGate::rescale(100.0, 3840, 2160, ref), 25.0), "Larger frames scale down");
    TEST_ASSERT(approx_eq(FrameGate::rescale(100.0, 0, 0, ref), 100.0), "Zero area passes through");
    return true;
}

bool test_admits_motion() {
    FrameGate gate;
    std::optional<double> s = gate.admit(MotionResult{1000.0, 960, 540}, 0.0);
    TEST_ASSERT(s.has_value(), "Non-zero scores always admitted");
    TEST_ASSERT(approx_eq(*s, 4000.0), "Rescaled on the way through");
    TEST_ASSERT(gate.admitted() == 1 && gate.dropped() == 0, "Counters");
    return true;
}

bool test_leading_zeros_admitted() {
    FrameGate gate;
    for (int i = 0; i < 3; i++) {
        std::optional<double> s = gate.admit(full_hd(0.0), i * 0.2);
        TEST_ASSERT(s.has_value() && *s == 0.0, "No motion seen yet, zeros are real");
    }
    TEST_ASSERT(gate.dropped() == 0, "Nothing dropped");
    return true;
}

bool test_duplicate_zeros_dropped() {
    FrameGate gate;
    gate.admit(full_hd(50'000.0), 10.0);
    for (int i = 1; i <= 4; i++)
        TEST_ASSERT(!gate.admit(full_hd(0.0), 10.0 + i * 0.1).has_value(), "Zero right after motion is a repeat");
    std::optional<double> s = gate.admit(full_hd(0.0), 10.5);
    TEST_ASSERT(s.has_value() && *s == 0.0, "Long enough zero streak is real stillness");
    TEST_ASSERT(gate.dropped() == 4, "Four dropped");
    TEST_ASSERT(gate.admitted() == 2, "Two admitted");
    return true;
}

bool test_zero_after_window_admitted() {
    FrameGate gate;
    gate.admit(full_hd(50'000.0), 10.0);
    TEST_ASSERT(gate.admit(full_hd(0.0), 11.5).has_value(), "Outside the duplicate window");
    return true;
}

bool test_motion_restarts_streak() {
    FrameGate gate;
    gate.admit(full_hd(50'000.0), 0.0);
    gate.admit(full_hd(0.0), 0.1);
    gate.admit(full_hd(0.0), 0.2);
    gate.admit(full_hd(60'000.0), 0.3);
    TEST_ASSERT(!gate.admit(full_hd(0.0), 0.4).has_value(), "Streak restarted by motion");
    TEST_ASSERT(gate.dropped() == 3, "Three dropped");
    return true;
}

bool test_suppression_disabled() {
    FrameGateSettings s;
    s.suppress_duplicates = false;
    FrameGate gate(s);
    gate.admit(full_hd(50'000.0), 0.0);
    TEST_ASSERT(gate.admit(full_hd(0.0), 0.1).has_value(), "Every frame admitted");
    TEST_ASSERT(gate.dropped() == 0, "Nothing dropped");
    return true;
}

bool test_reset() {
    FrameGate gate;
    gate.admit(full_hd(50'000.0), 0.0);
    gate.admit(full_hd(0.0), 0.1);
    gate.reset();
    TEST_ASSERT(gate.admitted() == 0 && gate.dropped() == 0, "Counters cleared");
    TEST_ASSERT(gate.admit(full_hd(0.0), 0.2).has_value(), "Previous motion forgotten");
    return true;
}

int main() {
    printf("Frame Gate Test Suite\n");
    printf("=====================\n\n");

    int total = 0, passed = 0, failed = 0;

    RUN_TEST(test_rescale_to_reference);
    RUN_TEST(test_admits_motion);
    RUN_TEST(test_leading_zeros_admitted);
    RUN_TEST(test_duplicate_zeros_dropped);
    RUN_TEST(test_zero_after_window_admitted);
    RUN_TEST(test_motion_restarts_streak);
    RUN_TEST(test_suppression_disabled);
    RUN_TEST(test_reset);

    printf("\n=====================\n");
    printf("Results: %d total, %d passed, %d failed\n", total, passed, failed);

    return (failed == 0) ? 0 : 1;
}
