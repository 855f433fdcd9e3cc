#pragma once
#include <string>
#include <ctime>

std::string now_timestamp();            // e.g. "2025-08-16 14:32:10.042"
std::string now_timestamp_filename();   // e.g. 2025-08-15_12-34-56
double wall_clock_seconds();            // system clock, seconds since epoch
double steady_clock_seconds();          // monotonic, arbitrary epoch
