#pragma once
#include <string>

namespace cfg {
// Capture
inline constexpr int CAPTURE_FPS = 5;              // source cadence the thresholds were tuned at
inline constexpr int REFERENCE_WIDTH  = 1920;
inline constexpr int REFERENCE_HEIGHT = 1080;
inline constexpr double REFERENCE_AREA = double(REFERENCE_WIDTH) * REFERENCE_HEIGHT;
inline constexpr int QUEUE_DEPTH = 5;              // worker backlog, oldest dropped

// Motion score extractor
inline constexpr double CLAHE_CLIP = 2.0;
inline constexpr int CLAHE_TILES   = 8;
inline constexpr int BLUR_KERNEL   = 21;
inline constexpr double DIFF_THRESHOLD = 5.0;
inline constexpr int DILATE_ITERS  = 2;
inline constexpr int GRID_COLS = 48;
inline constexpr int GRID_ROWS = 27;
inline constexpr int CALIBRATION_FRAMES = 25;      // ~5s at 5 fps
inline constexpr double PERSISTENT_RATIO = 0.70;
inline constexpr double MIN_CONTOUR_FRACTION   = 0.0005;
inline constexpr double MAX_ASPECT_RATIO       = 4.0;
inline constexpr double SMALL_CONTOUR_FRACTION = 0.01;
inline constexpr double EDGE_BAND_FRACTION     = 0.15;

// Breathing
inline constexpr double BREATH_PEAK_THRESHOLD = 50'000.0;
inline constexpr double MIN_BREATH_INTERVAL = 1.0;
inline constexpr double MAX_BREATH_INTERVAL = 5.0;
inline constexpr int BREATH_HISTORY = 50;
inline constexpr int RATE_WINDOW = 10;
inline constexpr int VARIABILITY_WINDOW = 20;
inline constexpr int MIN_RATE_INTERVALS = 3;
inline constexpr int MIN_VARIABILITY_INTERVALS = 5;
inline constexpr double BPM_DECAY_TIMEOUT = 15.0;
inline constexpr double LOW_VARIABILITY  = 0.10;
inline constexpr double HIGH_VARIABILITY = 0.20;

// Sleep state machine
inline constexpr double NO_MOTION_THRESHOLD   = 10'000.0;
inline constexpr double HIGH_MOTION_THRESHOLD = 3'000'000.0;
inline constexpr double DEEP_MOTION_MIN = 100'000.0;
inline constexpr double DEEP_MOTION_MAX = 800'000.0;
inline constexpr double REM_MOTION_MIN  = 800'000.0;
inline constexpr double REM_MOTION_MAX  = 2'000'000.0;
inline constexpr double DEEP_BPM_MIN = 25.0;
inline constexpr double DEEP_BPM_MAX = 35.0;
inline constexpr double REM_BPM_MIN  = 35.0;
inline constexpr double REM_BPM_MAX  = 50.0;
inline constexpr double QUIET_CEILING = 800'000.0;
inline constexpr double BUFFER_SECONDS   = 60.0;
inline constexpr double ANALYSIS_WINDOW  = 10.0;
inline constexpr double SPIKE_WINDOW     = 2.0;
inline constexpr double QUIET_WINDOW     = 30.0;
inline constexpr double WARMUP_SECONDS   = 10.0;
inline constexpr double CONFIRM_ALARM  = 20.0;
inline constexpr double CONFIRM_AWAKE  = 5.0;
inline constexpr double CONFIRM_SPASM  = 0.5;
inline constexpr double CONFIRM_OTHER  = 3.0;

// Duplicate frame suppression (decoder re-emits identical frames)
inline constexpr double DUPLICATE_WINDOW = 1.0;
inline constexpr int MIN_ZERO_STREAK = 5;

// Storage
inline const std::string SESSION_DIR = "./sessions";
inline const std::string SESSION_FILE = "sessions.csv";
}
