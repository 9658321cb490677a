/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "TickStatistics.hpp"

#include <algorithm>
#include <range/v3/algorithm/max.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/take.hpp>
#include <vector>

void TickStatistics::record(const Micros duration) noexcept {
    samples_[next_] = duration;
    next_ = (next_ + 1) % Capacity;
    count_ = std::min(count_ + 1, Capacity);
}

Micros TickStatistics::average() const noexcept {
    if (count_ == 0)
        return Micros::zero();
    const auto total = ranges::accumulate(samples_ | ranges::views::take(count_), Micros::zero());
    return total / static_cast<long>(count_);
}

Micros TickStatistics::maximum() const noexcept {
    if (count_ == 0)
        return Micros::zero();
    return ranges::max(samples_ | ranges::views::take(count_));
}

Micros TickStatistics::p99() const {
    if (count_ < MinSamplesForPercentile)
        return Micros::zero();
    std::vector<Micros> sorted(samples_.begin(), samples_.begin() + static_cast<long>(count_));
    ranges::sort(sorted);
    const auto index = std::min(static_cast<size_t>(static_cast<double>(count_) * 0.99), count_ - 1);
    return sorted[index];
}

void TickStatistics::reset() noexcept {
    samples_.fill(Micros::zero());
    next_ = 0;
    count_ = 0;
}
