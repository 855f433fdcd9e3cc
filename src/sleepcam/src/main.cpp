#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>
#include "config.hpp"
#include "log.hpp"
#include "monitor.hpp"
#include "recorder.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

static std::atomic<bool> g_running{true};

static void on_signal(int) { g_running = false; }

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <frames_dir> [--fps N] [--out DIR] [--roi x,y,w,h] [--verbose]\n"
              << "  Replays the images of <frames_dir> in name order through the sleep monitor.\n";
}

static bool parse_roi(const std::string& s, cv::Rect2d& roi) {
    double v[4];
    if (std::sscanf(s.c_str(), "%lf,%lf,%lf,%lf", &v[0], &v[1], &v[2], &v[3]) != 4) return false;
    for (double d : v)
        if (d < 0.0 || d > 1.0) return false;
    roi = cv::Rect2d(v[0], v[1], v[2], v[3]);
    return roi.width > 0 && roi.height > 0;
}

static bool read_file(const fs::path& p, std::vector<unsigned char>& out) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(argv[0]); return 1; }

    std::string frames_dir = argv[1];
    std::string out_dir = cfg::SESSION_DIR;
    int fps = cfg::CAPTURE_FPS;
    bool has_roi = false;
    cv::Rect2d roi;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--fps" && i + 1 < argc) {
            fps = std::atoi(argv[++i]);
        } else if (a == "--out" && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (a == "--roi" && i + 1 < argc) {
            if (!parse_roi(argv[++i], roi)) {
                std::cerr << "Invalid --roi, expected four values in 0..1\n";
                return 1;
            }
            has_roi = true;
        } else if (a == "--verbose") {
            set_log_level(LogLevel::Debug);
        } else {
            usage(argv[0]);
            return 1;
        }
    }
    if (fps <= 0) { std::cerr << "--fps must be positive\n"; return 1; }

    std::error_code ec;
    if (!fs::is_directory(frames_dir, ec)) {
        std::cerr << "Not a directory: " << frames_dir << "\n";
        return 1;
    }
    std::vector<fs::path> files;
    for (const auto& e : fs::directory_iterator(frames_dir, ec)) {
        if (e.is_regular_file()) files.push_back(e.path());
    }
    std::sort(files.begin(), files.end());
    if (files.empty()) {
        std::cerr << "No frames in " << frames_dir << "\n";
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    SessionRecorder recorder(out_dir);
    SleepMonitor monitor(&recorder);
    if (has_roi) monitor.set_roi(roi);

    SleepState shown = SleepState::Unknown;
    monitor.add_listener([&shown](const FrameReport& r) {
        if (r.state == shown) return;
        if (r.state == SleepState::NoBreathing)
            printf("[%s] ALARM: no breathing detected\n", now_timestamp().c_str());
        else if (shown == SleepState::NoBreathing)
            printf("[%s] alarm cleared\n", now_timestamp().c_str());
        printf("[%s] state %s -> %s (score %.0f)\n", now_timestamp().c_str(),
               to_string(shown), to_string(r.state), r.scaled_score);
        fflush(stdout);
        shown = r.state;
    });

    if (!monitor.start()) {
        std::cerr << "Failed to start monitor\n";
        return 1;
    }

    const auto period = std::chrono::microseconds(1'000'000 / fps);
    auto next = std::chrono::steady_clock::now();
    for (const auto& f : files) {
        if (!g_running) break;
        std::vector<unsigned char> bytes;
        if (!read_file(f, bytes)) {
            log_msg(LogLevel::Warning, "main", "cannot read %s", f.c_str());
            continue;
        }
        monitor.push_jpeg(std::move(bytes), steady_clock_seconds());
        next += period;
        std::this_thread::sleep_until(next);
    }
    monitor.wait_idle(std::chrono::seconds(5));

    std::optional<SleepSession> s = monitor.stop();
    if (!s) return 1;

    printf("Session %s: duration %lds, sleep %lds (deep %lds, light %lds), wake-ups %d, spasms %d, "
           "quality %d, avg %.1f bpm\n",
           s->id.empty() ? "(not stored)" : s->id.c_str(),
           static_cast<long>(s->end_time - s->start_time), static_cast<long>(s->total_sleep_seconds),
           static_cast<long>(s->deep_sleep_seconds), static_cast<long>(s->light_sleep_seconds),
           s->wake_up_count, s->spasm_count, s->quality_score, s->avg_breathing_bpm);
    return s->id.empty() ? 1 : 0;
}
