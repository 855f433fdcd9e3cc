/*
 * Session recorder tests
 * Writes into a scratch directory under the system temp dir.
 */

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "log.hpp"
#include "recorder.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

static std::string scratch_dir(const char* name) {
    fs::path p = fs::temp_directory_path() /
                 ("sleepcam_" + std::string(name) + "_" + std::to_string(::getpid()));
    fs::remove_all(p);
    return p.string();
}

static SleepSession sample_session(double start) {
    SleepSession s;
    s.start_time = start;
    s.end_time = start + 3600.0;
    s.total_sleep_seconds = 3000.0;
    s.deep_sleep_seconds = 1800.0;
    s.light_sleep_seconds = 1200.0;
    s.wake_up_count = 2;
    s.spasm_count = 1;
    s.quality_score = 71;
    s.avg_breathing_bpm = 31.25;
    s.timeline = "0:calibrating,10000:light_sleep,40000:deep_sleep";
    return s;
}

bool test_save_creates_file_with_header() {
    std::string dir = scratch_dir("header") + "/nested";
    SessionRecorder rec(dir);
    std::string id = rec.save(sample_session(1000.0));
    TEST_ASSERT(!id.empty(), "Saved");
    TEST_ASSERT(id.rfind("sess_", 0) == 0, "Id prefix");
    TEST_ASSERT(fs::exists(rec.path()), "File created along with its directory");

    std::ifstream in(rec.path());
    std::string header;
    std::getline(in, header);
    TEST_ASSERT(header.rfind("id,start,end,", 0) == 0, "Header line first");
    fs::remove_all(fs::path(dir).parent_path());
    return true;
}

bool test_round_trip() {
    std::string dir = scratch_dir("roundtrip");
    SessionRecorder rec(dir);
    std::string a = rec.save(sample_session(1000.0));
    std::string b = rec.save(sample_session(9000.0));
    TEST_ASSERT(a != b, "Ids are unique");

    std::vector<SleepSession> all = rec.load();
    TEST_ASSERT(all.size() == 2, "Both sessions read back");
    TEST_ASSERT(all[0].id == a && all[1].id == b, "Stored in order");
    const SleepSession& s = all[1];
    TEST_ASSERT(approx_eq(s.start_time, 9000.0), "Start");
    TEST_ASSERT(approx_eq(s.end_time, 12600.0), "End");
    TEST_ASSERT(approx_eq(s.deep_sleep_seconds, 1800.0), "Deep sleep");
    TEST_ASSERT(approx_eq(s.light_sleep_seconds, 1200.0), "Light sleep");
    TEST_ASSERT(s.wake_up_count == 2 && s.spasm_count == 1, "Counts");
    TEST_ASSERT(s.quality_score == 71, "Quality");
    TEST_ASSERT(approx_eq(s.avg_breathing_bpm, 31.25, 0.01), "Breathing rate");
    TEST_ASSERT(s.timeline == "0:calibrating,10000:light_sleep,40000:deep_sleep", "Timeline keeps its commas");
    fs::remove_all(dir);
    return true;
}

bool test_load_skips_malformed_lines() {
    std::string dir = scratch_dir("malformed");
    SessionRecorder rec(dir);
    rec.save(sample_session(1000.0));
    {
        std::ofstream out(rec.path(), std::ios::app);
        out << "garbage line\n";
        out << "sess_x,notanumber,1,2,3,4,5,6,7,8,\n";
    }
    rec.save(sample_session(2000.0));

    int warnings = 0;
    set_log_sink([&](LogLevel lvl, const std::string&) {
        if (lvl == LogLevel::Warning) warnings++;
    });
    std::vector<SleepSession> all = rec.load();
    set_log_sink(nullptr);

    TEST_ASSERT(all.size() == 2, "Good lines survive");
    TEST_ASSERT(warnings == 2, "Each bad line reported");
    fs::remove_all(dir);
    return true;
}

bool test_load_missing_file() {
    SessionRecorder rec(scratch_dir("missing"));
    TEST_ASSERT(rec.load().empty(), "Nothing stored yet");
    return true;
}

bool test_parse_empty_timeline() {
    SleepSession s;
    TEST_ASSERT(parse_session_line("sess_1,1.0,2.0,0,0,0,0,0,100,0.00,", s), "Empty timeline is fine");
    TEST_ASSERT(s.id == "sess_1" && s.timeline.empty(), "Fields");
    TEST_ASSERT(!parse_session_line("sess_1,1.0,2.0", s), "Too few fields");
    return true;
}

bool test_unwritable_location() {
    std::string base = scratch_dir("blocked");
    fs::create_directories(base);
    { std::ofstream(base + "/file") << "x"; }
    SessionRecorder rec(base + "/file/sub");

    set_log_sink([](LogLevel, const std::string&) {});
    std::string id = rec.save(sample_session(1.0));
    set_log_sink(nullptr);

    TEST_ASSERT(id.empty(), "Failure reported as an empty id");
    fs::remove_all(base);
    return true;
}

int main() {
    printf("Session Recorder Test Suite\n");
    printf("===========================\n\n");

    int total = 0, passed = 0, failed = 0;

    RUN_TEST(test_save_creates_file_with_header);
    RUN_TEST(test_round_trip);
    RUN_TEST(test_load_skips_malformed_lines);
    RUN_TEST(test_load_missing_file);
    RUN_TEST(test_parse_empty_timeline);
    RUN_TEST(test_unwritable_location);

    printf("\n===========================\n");
    printf("Results: %d total, %d passed, %d failed\n", total, passed, failed);

    return (failed == 0) ? 0 : 1;
}
