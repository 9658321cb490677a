/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "TimerQueue.hpp"

#include <algorithm>
#include <exception>

void TimerToken::cancel() noexcept {
    if (state_)
        state_->cancelled = true;
}

bool TimerToken::is_pending() const noexcept { return state_ && !state_->cancelled && !state_->fired; }

TimerQueue::TimerQueue(Logger &logger) : logger_(logger) {}

bool TimerQueue::runs_later(const Entry &lhs, const Entry &rhs) noexcept {
    if (lhs.when != rhs.when)
        return lhs.when > rhs.when;
    return lhs.sequence > rhs.sequence;
}

TimerToken TimerQueue::schedule(const Time when, Callback callback) {
    auto state = std::make_shared<TimerToken::State>();
    entries_.push_back(Entry{when, next_sequence_++, std::move(callback), state});
    std::push_heap(entries_.begin(), entries_.end(), runs_later);
    return TimerToken{std::move(state)};
}

size_t TimerQueue::run_due(const Time now) {
    size_t run{};
    while (!entries_.empty() && entries_.front().when <= now) {
        std::pop_heap(entries_.begin(), entries_.end(), runs_later);
        auto entry = std::move(entries_.back());
        entries_.pop_back();
        if (entry.state->cancelled)
            continue;
        entry.state->fired = true;
        ++run;
        try {
            entry.callback();
        } catch (const std::exception &e) {
            logger_.bug("timer callback failed: {}", e.what());
        }
    }
    return run;
}

std::optional<Time> TimerQueue::next_due() const {
    if (entries_.empty())
        return std::nullopt;
    return entries_.front().when;
}

void TimerQueue::clear() {
    for (auto &entry : entries_)
        entry.state->cancelled = true;
    entries_.clear();
}
