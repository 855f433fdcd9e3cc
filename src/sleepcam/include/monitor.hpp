#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>
#include <opencv2/opencv.hpp>
#include "frame_gate.hpp"
#include "motion.hpp"
#include "session.hpp"

struct MonitorSettings {
    MotionSettings motion;
    FrameGateSettings gate;
    StateMachineSettings machine;
    BreathingSettings breathing;
    size_t queue_depth = cfg::QUEUE_DEPTH;
};

// What one processed frame produced.
struct FrameReport {
    long frame_no = 0;
    double timestamp = 0.0;
    int width = 0;
    int height = 0;
    double raw_score = 0.0;
    double scaled_score = 0.0;
    bool skipped = false;        // dropped by the duplicate-frame gate
    SleepState state = SleepState::Unknown;
};

// Runs the whole pipeline on one worker thread fed from a bounded queue.
// Frames are processed strictly in push order.
class SleepMonitor {
public:
    explicit SleepMonitor(SessionStore* store, TimeSource clock = TimeSource(),
                          const MonitorSettings& settings = MonitorSettings());
    ~SleepMonitor();

    bool start();
    // Stops the worker (queued frames are discarded) and closes the session.
    std::optional<SleepSession> stop();
    bool running() const { return run_; }

    // Timestamps are seconds on any monotonic base (capture time, steady
    // clock); they drive the timers. The clock only dates the session record.
    void push_frame(const cv::Mat& frame, double timestamp);
    void push_jpeg(std::vector<unsigned char> jpeg, double timestamp);
    // Blocks until the queue is empty and no frame is in flight.
    bool wait_idle(std::chrono::milliseconds timeout);

    using ReportSink = std::function<void(const FrameReport&)>;
    // Sinks run on the worker thread and may add or remove listeners. A sink
    // removed while a frame is being reported still sees that frame.
    int add_listener(ReportSink cb);
    void remove_listener(int id);

    void set_roi(const cv::Rect2d& roi);
    void clear_roi();

    FrameReport last_report() const;
    SleepStats get_stats() const;
    long frames_processed() const;
    long frames_dropped() const { return queue_dropped_; }

private:
    struct Job {
        cv::Mat image;
        std::vector<unsigned char> jpeg;
        double timestamp = 0.0;
    };

    MonitorSettings settings_;

    // pipeline; only touched with pipe_m_ held
    mutable std::mutex pipe_m_;
    MotionDetector detector_;
    FrameGate gate_;
    SessionAggregator aggregator_;
    FrameReport last_;
    long frames_ = 0;

    // queue
    std::mutex q_m_;
    std::condition_variable q_cv_;
    std::condition_variable idle_cv_;
    std::queue<Job> queue_;
    bool busy_ = false;
    std::atomic<long> queue_dropped_{0};
    std::thread th_;
    std::atomic<bool> run_{false};

    // sinks
    std::mutex sinks_m_;
    int next_sink_id_ = 1;
    std::vector<std::pair<int, ReportSink>> sinks_;

    void enqueue(Job job);
    void worker_thread_fn();
    std::optional<FrameReport> process(const Job& job);
};
