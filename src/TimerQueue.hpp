/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Logging.hpp"
#include "common/Time.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

// Retained by whatever owns a scheduled callback so it can be called off. Cancelling is
// idempotent and harmless after the callback has already run.
class TimerToken {
public:
    TimerToken() = default;
    void cancel() noexcept;
    // True while the callback is still due to run.
    [[nodiscard]] bool is_pending() const noexcept;

private:
    friend class TimerQueue;
    struct State {
        bool cancelled{};
        bool fired{};
    };
    explicit TimerToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// One-shot timers drained from the game loop. Everything runs on the caller's thread, so
// callbacks are serialized with each other and with the pulse.
class TimerQueue {
public:
    using Callback = std::function<void()>;

    explicit TimerQueue(Logger &logger);
    TimerQueue(const TimerQueue &) = delete;
    TimerQueue &operator=(const TimerQueue &) = delete;

    TimerToken schedule(const Time when, Callback callback);
    // Runs everything due at or before |now| in due order, ties in scheduling order. A callback
    // may schedule further timers; those run in this call too if they are already due.
    // Returns the number of callbacks run.
    size_t run_due(const Time now);
    [[nodiscard]] std::optional<Time> next_due() const;
    // Includes cancelled timers that haven't been drained yet.
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    void clear();

private:
    struct Entry {
        Time when;
        uint64_t sequence;
        Callback callback;
        std::shared_ptr<TimerToken::State> state;
    };
    static bool runs_later(const Entry &lhs, const Entry &rhs) noexcept;

    Logger &logger_;
    std::vector<Entry> entries_;
    uint64_t next_sequence_{};
};
