#include "sleep_state.hpp"

const char* to_string(SleepState s) {
    switch (s) {
    case SleepState::Unknown:     return "unknown";
    case SleepState::Calibrating: return "calibrating";
    case SleepState::NoBreathing: return "no_breathing";
    case SleepState::DeepSleep:   return "deep_sleep";
    case SleepState::LightSleep:  return "light_sleep";
    case SleepState::RemSleep:    return "rem_sleep";
    case SleepState::Spasm:       return "spasm";
    case SleepState::Awake:       return "awake";
    }
    return "unknown";
}

bool is_sleep_like(SleepState s) {
    return s == SleepState::DeepSleep || s == SleepState::LightSleep || s == SleepState::RemSleep;
}
