// recorder.cpp
#include "recorder.hpp"
#include "config.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

static const char* TAG = "SessionRecorder";
static const char* HEADER =
    "id,start,end,total_sleep_s,deep_sleep_s,light_sleep_s,wake_ups,spasms,quality,avg_bpm,timeline";

SessionRecorder::SessionRecorder(const std::string& dir)
    : dir_(dir), path_(dir + "/" + cfg::SESSION_FILE) {}

bool SessionRecorder::ensure_file() {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        log_msg(LogLevel::Error, TAG, "cannot create %s: %s", dir_.c_str(), ec.message().c_str());
        return false;
    }
    if (std::filesystem::exists(path_)) return true;

    std::ofstream out(path_);
    if (!out) return false;
    out << HEADER << "\n";
    return out.good();
}

std::string SessionRecorder::save(const SleepSession& s) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!ensure_file()) {
        log_msg(LogLevel::Error, TAG, "cannot open %s", path_.c_str());
        return std::string();
    }

    std::string id = "sess_" + now_timestamp_filename() + "_" + std::to_string(++saved_);
    std::ofstream out(path_, std::ios::app);
    out << id << std::fixed << std::setprecision(3)
        << ',' << s.start_time << ',' << s.end_time
        << ',' << s.total_sleep_seconds << ',' << s.deep_sleep_seconds << ',' << s.light_sleep_seconds
        << ',' << s.wake_up_count << ',' << s.spasm_count << ',' << s.quality_score
        << ',' << std::setprecision(2) << s.avg_breathing_bpm
        << ',' << s.timeline << "\n";
    out.flush();
    if (!out.good()) {
        log_msg(LogLevel::Error, TAG, "write to %s failed", path_.c_str());
        return std::string();
    }
    return id;
}

bool parse_session_line(const std::string& line, SleepSession& out) {
    // The timeline is the last column and carries its own commas.
    std::vector<std::string> f;
    size_t pos = 0;
    while (f.size() < 10) {
        size_t comma = line.find(',', pos);
        if (comma == std::string::npos) return false;
        f.push_back(line.substr(pos, comma - pos));
        pos = comma + 1;
    }
    try {
        SleepSession s;
        s.id = f[0];
        s.start_time = std::stod(f[1]);
        s.end_time = std::stod(f[2]);
        s.total_sleep_seconds = std::stod(f[3]);
        s.deep_sleep_seconds = std::stod(f[4]);
        s.light_sleep_seconds = std::stod(f[5]);
        s.wake_up_count = std::stoi(f[6]);
        s.spasm_count = std::stoi(f[7]);
        s.quality_score = std::stoi(f[8]);
        s.avg_breathing_bpm = std::stod(f[9]);
        s.timeline = line.substr(pos);
        out = std::move(s);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<SleepSession> SessionRecorder::load() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<SleepSession> sessions;
    std::ifstream in(path_);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) { header = false; continue; }
        if (line.empty()) continue;
        SleepSession s;
        if (parse_session_line(line, s))
            sessions.push_back(std::move(s));
        else
            log_msg(LogLevel::Warning, TAG, "skipping malformed line in %s", path_.c_str());
    }
    return sessions;
}
