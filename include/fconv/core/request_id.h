#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace fconv::core {

/**
 * Generate a 12 hex character request id.
 *
 * The upper bits come from a per-thread mt19937_64, the lower 16 bits from a
 * process-wide counter, so two ids generated in the same process never collide
 * within 65536 consecutive requests even if the generators repeat.
 */
inline std::string generateRequestId() {
    static thread_local std::mt19937_64 rng{std::random_device{}() ^
                                            static_cast<uint64_t>(std::chrono::steady_clock::now()
                                                                      .time_since_epoch()
                                                                      .count())};
    static std::atomic<uint32_t> counter{0};
    std::uniform_int_distribution<uint32_t> dist;
    uint32_t r = dist(rng);
    uint32_t c = counter.fetch_add(1, std::memory_order_relaxed) & 0xFFFF;

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%08x%04x", r, c);
    return std::string(buf);
}

} // namespace fconv::core
