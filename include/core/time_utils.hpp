#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace puv {

int64_t nowSteadyNs();
int64_t nowSteadyMs();
int64_t nowWallMs();

// "2024-05-01T08:30:00.250Z"
std::string formatIsoUtc(int64_t wall_ms);

// Injected wherever a component compares against the clock, so tests can drive time.
using MillisClock = std::function<int64_t()>;

}  // namespace puv
