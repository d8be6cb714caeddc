#pragma once

#include <chrono>
#include <string>
#include <string_view>

// accepts an integer followed by a unit: ns, us, ms, s, m, h ("1500ms", "4s")
std::chrono::nanoseconds parseDuration(std::string_view);

// uses the largest unit that represents the value exactly
std::string formatDuration(std::chrono::nanoseconds);
