#include "core/types/ProbeResult.hpp"

#include <cmath>

namespace connmon::core {

ProbeResult ProbeResult::failure(std::string error) {
    ProbeResult result;
    result.connected = false;
    result.errorMessage = std::move(error);
    result.timestamp = std::chrono::system_clock::now();
    return result;
}

double roundLatency(double ms) {
    return std::round(ms * 100.0) / 100.0;
}

double toLatencyMs(std::chrono::steady_clock::duration elapsed) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
    return roundLatency(static_cast<double>(us) / 1000.0);
}

} // namespace connmon::core
