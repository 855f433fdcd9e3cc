#include "monitor.hpp"
#include "log.hpp"
#include "utils.hpp"

static const char* TAG = "SleepMonitor";

SleepMonitor::SleepMonitor(SessionStore* store, TimeSource clock, const MonitorSettings& settings)
    : settings_(settings),
      detector_(settings.motion),
      gate_(settings.gate),
      aggregator_(store, clock ? std::move(clock) : TimeSource(wall_clock_seconds),
                  settings.machine, settings.breathing) {}

SleepMonitor::~SleepMonitor() {
    if (run_) stop();
}

bool SleepMonitor::start() {
    if (run_) {
        log_msg(LogLevel::Warning, TAG, "already running");
        return false;
    }
    {
        std::lock_guard<std::mutex> pl(pipe_m_);
        detector_.reset();
        gate_.reset();
        frames_ = 0;
        last_ = FrameReport{};
        aggregator_.start_session();
    }
    queue_dropped_ = 0;
    run_ = true;
    th_ = std::thread(&SleepMonitor::worker_thread_fn, this);
    log_msg(LogLevel::Info, TAG, "monitoring started");
    return true;
}

std::optional<SleepSession> SleepMonitor::stop() {
    {
        std::lock_guard<std::mutex> lk(q_m_);
        run_ = false;
    }
    q_cv_.notify_all();
    if (th_.joinable()) th_.join();

    {
        std::lock_guard<std::mutex> lk(q_m_);
        std::queue<Job>().swap(queue_);
        busy_ = false;
    }
    idle_cv_.notify_all();

    std::lock_guard<std::mutex> pl(pipe_m_);
    log_msg(LogLevel::Info, TAG, "monitoring stopped after %ld frames (%ld dropped by queue, %ld by gate)",
            frames_, queue_dropped_.load(), gate_.dropped());
    return aggregator_.stop_session();
}

void SleepMonitor::push_frame(const cv::Mat& frame, double timestamp) {
    Job job;
    job.image = frame.clone();
    job.timestamp = timestamp;
    enqueue(std::move(job));
}

void SleepMonitor::push_jpeg(std::vector<unsigned char> jpeg, double timestamp) {
    Job job;
    job.jpeg = std::move(jpeg);
    job.timestamp = timestamp;
    enqueue(std::move(job));
}

void SleepMonitor::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lk(q_m_);
        if (!run_) return;
        // Keep the queue short; drop oldest if necessary
        if (queue_.size() >= settings_.queue_depth) {
            queue_.pop();
            queue_dropped_++;
        }
        queue_.push(std::move(job));
    }
    q_cv_.notify_one();
}

bool SleepMonitor::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(q_m_);
    return idle_cv_.wait_for(lk, timeout, [&] { return queue_.empty() && !busy_; });
}

int SleepMonitor::add_listener(ReportSink cb) {
    std::lock_guard<std::mutex> lk(sinks_m_);
    int id = next_sink_id_++;
    sinks_.push_back({id, std::move(cb)});
    return id;
}

void SleepMonitor::remove_listener(int id) {
    std::lock_guard<std::mutex> lk(sinks_m_);
    for (auto it = sinks_.begin(); it != sinks_.end(); ++it) {
        if (it->first == id) { sinks_.erase(it); break; }
    }
}

void SleepMonitor::set_roi(const cv::Rect2d& roi) {
    std::lock_guard<std::mutex> pl(pipe_m_);
    detector_.set_roi(roi);
}

void SleepMonitor::clear_roi() {
    std::lock_guard<std::mutex> pl(pipe_m_);
    detector_.clear_roi();
}

FrameReport SleepMonitor::last_report() const {
    std::lock_guard<std::mutex> pl(pipe_m_);
    return last_;
}

SleepStats SleepMonitor::get_stats() const {
    std::lock_guard<std::mutex> pl(pipe_m_);
    return aggregator_.get_stats();
}

long SleepMonitor::frames_processed() const {
    std::lock_guard<std::mutex> pl(pipe_m_);
    return frames_;
}

void SleepMonitor::worker_thread_fn() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lk(q_m_);
            q_cv_.wait(lk, [&] { return !run_ || !queue_.empty(); });
            if (!run_) break;
            job = std::move(queue_.front());
            queue_.pop();
            busy_ = true;
        }

        std::optional<FrameReport> report = process(job);
        if (report) {
            // Snapshot so a listener may add or remove listeners.
            std::vector<std::pair<int, ReportSink>> sinks;
            {
                std::lock_guard<std::mutex> lk(sinks_m_);
                sinks = sinks_;
            }
            for (auto& p : sinks) {
                if (p.second) p.second(*report);
            }
        }

        {
            std::lock_guard<std::mutex> lk(q_m_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

std::optional<FrameReport> SleepMonitor::process(const Job& job) {
    std::lock_guard<std::mutex> pl(pipe_m_);

    MotionResult r = job.jpeg.empty() ? detector_.process_frame(job.image)
                                      : detector_.process_jpeg(job.jpeg);
    if (r.width == 0 || r.height == 0) return std::nullopt;  // rejected frame

    FrameReport rep;
    rep.frame_no = ++frames_;
    rep.timestamp = job.timestamp;
    rep.width = r.width;
    rep.height = r.height;
    rep.raw_score = r.score;

    std::optional<double> scaled = gate_.admit(r, job.timestamp);
    if (scaled) {
        rep.scaled_score = *scaled;
        rep.state = aggregator_.update(*scaled, job.timestamp);
    } else {
        rep.skipped = true;
        rep.state = aggregator_.current_state();
    }
    last_ = rep;

    if (frames_ % 50 == 0) {
        log_msg(LogLevel::Info, TAG, "frames=%ld raw=%.0f scaled=%.0f res=%dx%d state=%s",
                frames_, rep.raw_score, rep.scaled_score, r.width, r.height, to_string(rep.state));
    }
    return rep;
}
