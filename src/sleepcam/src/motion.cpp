#include "motion.hpp"
#include "log.hpp"
#include <algorithm>

static const char* TAG = "MotionDetector";

MotionDetector::MotionDetector(const MotionSettings& settings)
    : settings_(settings),
      clahe_(cv::createCLAHE(settings.clahe_clip, cv::Size(settings.clahe_tiles, settings.clahe_tiles))),
      heat_map_(static_cast<size_t>(settings.grid_rows * settings.grid_cols), 0) {}

MotionResult MotionDetector::process_jpeg(const std::vector<unsigned char>& jpeg) {
    cv::Mat img = cv::imdecode(jpeg, cv::IMREAD_COLOR);
    if (img.empty()) {
        log_msg(LogLevel::Warning, TAG, "undecodable frame (%zu bytes) ignored", jpeg.size());
        return MotionResult{};
    }
    return process_frame(img);
}

MotionResult MotionDetector::process_frame(const cv::Mat& frame) {
    if (frame.empty() || frame.depth() != CV_8U) {
        log_msg(LogLevel::Warning, TAG, "empty or non 8-bit frame ignored");
        return MotionResult{};
    }
    const int ch = frame.channels();
    if (ch != 1 && ch != 3 && ch != 4) {
        log_msg(LogLevel::Warning, TAG, "unsupported channel count %d", ch);
        return MotionResult{};
    }

    const int width = frame.cols;
    const int height = frame.rows;
    cv::Mat gray = preprocess(frame);

    if (!prev_gray_.empty() && prev_gray_.size() != gray.size()) {
        log_msg(LogLevel::Info, TAG, "frame size changed %dx%d -> %dx%d, recalibrating",
                prev_gray_.cols, prev_gray_.rows, width, height);
        reset();
    }

    if (prev_gray_.empty()) {
        prev_gray_ = std::move(gray);
        return MotionResult{0.0, width, height};
    }

    cv::Mat diff;
    cv::absdiff(prev_gray_, gray, diff);

    cv::Mat fg;
    cv::threshold(diff, fg, settings_.diff_threshold, 255, cv::THRESH_BINARY);
    cv::dilate(fg, fg, cv::Mat(), cv::Point(-1, -1), settings_.dilate_iters);
    apply_roi(fg);

    // Current frame becomes the reference; the old buffer is released here.
    prev_gray_ = std::move(gray);

    if (!calibrated_) {
        update_heat_map(fg);
        calibration_count_++;
        if (calibration_count_ < settings_.calibration_frames) {
            // Shape filters only, so callers get a usable score right away.
            return MotionResult{score_foreground(fg, false), width, height};
        }
        build_exclusion_mask(width, height);
        calibrated_ = true;
        log_msg(LogLevel::Info, TAG, "calibration complete after %d frames", calibration_count_);
    }

    return MotionResult{score_foreground(fg, true), width, height};
}

cv::Mat MotionDetector::preprocess(const cv::Mat& frame) const {
    cv::Mat gray;
    switch (frame.channels()) {
    case 3:  cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY); break;
    case 4:  cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY); break;
    default: gray = frame.clone(); break;
    }
    clahe_->apply(gray, gray);
    cv::GaussianBlur(gray, gray, cv::Size(settings_.blur_kernel, settings_.blur_kernel), 0);
    return gray;
}

void MotionDetector::apply_roi(cv::Mat& fg) const {
    if (!has_roi_) return;
    cv::Rect r(static_cast<int>(roi_.x * fg.cols), static_cast<int>(roi_.y * fg.rows),
               static_cast<int>(roi_.width * fg.cols), static_cast<int>(roi_.height * fg.rows));
    r &= cv::Rect(0, 0, fg.cols, fg.rows);

    cv::Mat keep = cv::Mat::zeros(fg.size(), CV_8UC1);
    if (r.area() > 0) keep(r).setTo(255);
    cv::bitwise_and(fg, keep, fg);
}

cv::Rect MotionDetector::cell_rect(int row, int col, int width, int height) const {
    const double cw = double(width) / settings_.grid_cols;
    const double chh = double(height) / settings_.grid_rows;
    int x0 = std::min(static_cast<int>(col * cw), width - 1);
    int y0 = std::min(static_cast<int>(row * chh), height - 1);
    int x1 = col == settings_.grid_cols - 1 ? width : std::min(static_cast<int>((col + 1) * cw), width);
    int y1 = row == settings_.grid_rows - 1 ? height : std::min(static_cast<int>((row + 1) * chh), height);
    return cv::Rect(x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0));
}

void MotionDetector::update_heat_map(const cv::Mat& fg) {
    for (int row = 0; row < settings_.grid_rows; ++row) {
        for (int col = 0; col < settings_.grid_cols; ++col) {
            cv::Rect r = cell_rect(row, col, fg.cols, fg.rows);
            if (r.area() <= 0) continue;
            if (cv::countNonZero(fg(r)) > 0)
                heat_map_[row * settings_.grid_cols + col]++;
        }
    }
}

void MotionDetector::build_exclusion_mask(int width, int height) {
    exclusion_mask_ = cv::Mat(height, width, CV_8UC1, cv::Scalar(255));
    masked_cells_ = 0;

    const double threshold = calibration_count_ * settings_.persistent_ratio;
    const int margin_x = static_cast<int>(0.5 * width / settings_.grid_cols);
    const int margin_y = static_cast<int>(0.5 * height / settings_.grid_rows);
    const cv::Rect frame_rect(0, 0, width, height);

    for (int row = 0; row < settings_.grid_rows; ++row) {
        for (int col = 0; col < settings_.grid_cols; ++col) {
            int hits = heat_map_[row * settings_.grid_cols + col];
            if (hits <= threshold) continue;

            cv::Rect r = cell_rect(row, col, width, height);
            r = cv::Rect(r.x - margin_x, r.y - margin_y,
                         r.width + 2 * margin_x, r.height + 2 * margin_y) & frame_rect;
            cv::rectangle(exclusion_mask_, r, cv::Scalar(0), cv::FILLED);
            masked_cells_++;
            if (masked_cells_ <= 10)
                log_msg(LogLevel::Debug, TAG, "masking cell (%d,%d) hits=%d/%d",
                        col, row, hits, calibration_count_);
        }
    }

    if (masked_cells_ == 0) {
        log_msg(LogLevel::Info, TAG, "no persistent motion zones found, mask stays open");
    } else {
        log_msg(LogLevel::Info, TAG, "exclusion mask: %d of %d cells masked (threshold %.1f hits)",
                masked_cells_, settings_.grid_rows * settings_.grid_cols, threshold);
    }
}

double MotionDetector::score_foreground(const cv::Mat& fg, bool use_mask) const {
    cv::Mat masked;
    if (use_mask && !exclusion_mask_.empty())
        cv::bitwise_and(fg, exclusion_mask_, masked);
    else
        masked = fg.clone();

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(masked, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    const double frame_area = double(fg.cols) * fg.rows;
    const double min_area = frame_area * settings_.min_contour_fraction;
    const double small_area = frame_area * settings_.small_contour_fraction;
    const double top_band = fg.rows * settings_.edge_band_fraction;
    const double bottom_band = fg.rows * (1.0 - settings_.edge_band_fraction);

    cv::Mat kept = cv::Mat::zeros(fg.size(), CV_8UC1);
    for (size_t i = 0; i < contours.size(); ++i) {
        double area = cv::contourArea(contours[i]);
        if (area <= min_area) continue;

        cv::Rect r = cv::boundingRect(contours[i]);
        double ar = double(r.width) / std::max(1, r.height);
        if (ar > settings_.max_aspect_ratio || ar < 1.0 / settings_.max_aspect_ratio)
            continue;  // text-shaped

        bool at_edge = r.y < top_band || (r.y + r.height) > bottom_band;
        if (at_edge && area < small_area)
            continue;  // leftover overlay fragment

        cv::drawContours(kept, contours, static_cast<int>(i), cv::Scalar(255), cv::FILLED);
    }
    return cv::sum(kept)[0];
}

void MotionDetector::reset() {
    prev_gray_.release();
    exclusion_mask_.release();
    std::fill(heat_map_.begin(), heat_map_.end(), 0);
    calibration_count_ = 0;
    calibrated_ = false;
    masked_cells_ = 0;
}

void MotionDetector::set_roi(const cv::Rect2d& roi) {
    roi_ = roi;
    has_roi_ = true;
}

void MotionDetector::clear_roi() {
    has_roi_ = false;
}

int MotionDetector::heat(int row, int col) const {
    if (row < 0 || row >= settings_.grid_rows || col < 0 || col >= settings_.grid_cols) return 0;
    return heat_map_[row * settings_.grid_cols + col];
}
