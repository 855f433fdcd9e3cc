#pragma once
#include <vector>
#include <opencv2/opencv.hpp>
#include "config.hpp"

struct MotionSettings {
    double clahe_clip = cfg::CLAHE_CLIP;
    int clahe_tiles = cfg::CLAHE_TILES;
    int blur_kernel = cfg::BLUR_KERNEL;              // odd
    double diff_threshold = cfg::DIFF_THRESHOLD;
    int dilate_iters = cfg::DILATE_ITERS;
    int grid_cols = cfg::GRID_COLS;
    int grid_rows = cfg::GRID_ROWS;
    int calibration_frames = cfg::CALIBRATION_FRAMES;
    double persistent_ratio = cfg::PERSISTENT_RATIO;
    double min_contour_fraction = cfg::MIN_CONTOUR_FRACTION;
    double max_aspect_ratio = cfg::MAX_ASPECT_RATIO;
    double small_contour_fraction = cfg::SMALL_CONTOUR_FRACTION;
    double edge_band_fraction = cfg::EDGE_BAND_FRACTION;
};

struct MotionResult {
    double score = 0.0;  // sum of surviving foreground pixel values (255 per pixel)
    int width = 0;
    int height = 0;
};

// Frame-differencing motion scorer. The first frames calibrate a heat map of
// cells that change on nearly every frame (burned-in clocks, OSD text); those
// cells are masked out for the rest of the instance's life.
// Not thread-safe: frames must arrive in capture order from one caller.
class MotionDetector {
public:
    explicit MotionDetector(const MotionSettings& settings = MotionSettings());

    // Accepts 1, 3 (BGR) or 4 (BGRA) channel 8-bit images.
    MotionResult process_frame(const cv::Mat& frame);
    // Decodes a JPEG first; undecodable input yields an empty result.
    MotionResult process_jpeg(const std::vector<unsigned char>& jpeg);

    void reset();

    // Normalized (0..1) detection zone; pixels outside are ignored.
    void set_roi(const cv::Rect2d& roi);
    void clear_roi();

    bool calibrated() const { return calibrated_; }
    int calibration_frame_count() const { return calibration_count_; }
    int masked_cell_count() const { return masked_cells_; }
    // Empty until calibration completes. White = counted, black = excluded.
    const cv::Mat& exclusion_mask() const { return exclusion_mask_; }
    int heat(int row, int col) const;

private:
    MotionSettings settings_;
    cv::Ptr<cv::CLAHE> clahe_;
    cv::Mat prev_gray_;
    cv::Mat exclusion_mask_;
    std::vector<int> heat_map_;  // grid_rows * grid_cols hit counters
    int calibration_count_ = 0;
    bool calibrated_ = false;
    int masked_cells_ = 0;
    bool has_roi_ = false;
    cv::Rect2d roi_;

    cv::Mat preprocess(const cv::Mat& frame) const;
    void apply_roi(cv::Mat& fg) const;
    cv::Rect cell_rect(int row, int col, int width, int height) const;
    void update_heat_map(const cv::Mat& fg);
    void build_exclusion_mask(int width, int height);
    double score_foreground(const cv::Mat& fg, bool use_mask) const;
};
