#pragma once

enum class SleepState {
    Unknown,
    Calibrating,
    NoBreathing,
    DeepSleep,
    LightSleep,
    RemSleep,
    Spasm,
    Awake
};

const char* to_string(SleepState s);   // "deep_sleep", "no_breathing", ...
bool is_sleep_like(SleepState s);      // deep, light or REM
