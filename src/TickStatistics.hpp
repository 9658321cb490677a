/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <array>
#include <chrono>
#include <cstddef>

using Micros = std::chrono::microseconds;

// Durations of the most recent pulses, oldest overwritten first.
class TickStatistics {
public:
    static inline constexpr size_t Capacity = 1000;
    // Fewer samples than this give a meaningless 99th percentile, which is reported as zero.
    static inline constexpr size_t MinSamplesForPercentile = 10;

    void record(const Micros duration) noexcept;
    [[nodiscard]] Micros average() const noexcept;
    [[nodiscard]] Micros maximum() const noexcept;
    [[nodiscard]] Micros p99() const;
    [[nodiscard]] size_t sample_count() const noexcept { return count_; }
    void reset() noexcept;

private:
    std::array<Micros, Capacity> samples_{};
    size_t next_{};
    size_t count_{};
};
