// recorder.hpp
#pragma once
#include <string>
#include <vector>
#include <mutex>
#include "session.hpp"

// Appends finished sessions to <dir>/sessions.csv, one line each.
class SessionRecorder : public SessionStore {
public:
    explicit SessionRecorder(const std::string& dir);
    std::string save(const SleepSession& session) override;
    // Every session stored so far, oldest first. Malformed lines are skipped.
    std::vector<SleepSession> load() const;
    const std::string& path() const { return path_; }
private:
    std::string dir_;
    std::string path_;
    int saved_ = 0;
    mutable std::mutex mtx_;
    bool ensure_file();
};

// Parses one line written by SessionRecorder::save().
bool parse_session_line(const std::string& line, SleepSession& out);
