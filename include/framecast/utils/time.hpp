#pragma once

#include <cstdint>
#include <chrono>

namespace framecast::utils {

// Monotonic milliseconds; used for reassembly timestamps and sweeps
inline uint64_t time_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

// Wall-clock Unix seconds; embedded in persisted frame names
inline uint64_t unix_time() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

// Elapsed milliseconds between two monotonic stamps, 0 if now precedes since
inline uint64_t elapsed_ms(uint64_t since_ms, uint64_t now_ms) {
    return now_ms > since_ms ? now_ms - since_ms : 0;
}

}  // namespace framecast::utils
