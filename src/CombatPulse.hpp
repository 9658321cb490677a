/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "CombatEvents.hpp"
#include "CombatantTimingState.hpp"
#include "Logging.hpp"
#include "TickStatistics.hpp"
#include "TimerQueue.hpp"
#include "TimingProvider.hpp"
#include "World.hpp"
#include "common/CombatPolicy.hpp"

#include <cstdint>
#include <unordered_set>

// Works out what a landed swing does. Owned by the game's combat rules.
struct AttackResolver {
    virtual ~AttackResolver() = default;
    virtual void resolve_swing(Actor &attacker, Actor &defender) = 0;
};

// A point in time view of the pulse for operators.
struct PulseMetrics {
    Micros average_tick;
    Micros max_tick;
    Micros p99_tick;
    uint64_t total_ticks;
    size_t active_combatants;
    uint64_t throttle_events;
    uint64_t faults;
    Millis period;
};

enum class PulseState { Uninitialized, Running, Stopped };

// A single fixed rate pulse that drives every registered combatant's swings, in place of a
// timer per actor. Each tick takes the world's current time, so a slow tick delays the next
// one rather than queueing catch-up ticks.
class CombatPulse {
public:
    CombatPulse(World &world, TimerQueue &timers, CombatStates &states, const TimingProvider &timing,
                AttackResolver &resolver, const PulseSettings &settings, EventSink &events, Logger &logger);
    ~CombatPulse();
    CombatPulse(const CombatPulse &) = delete;
    CombatPulse &operator=(const CombatPulse &) = delete;

    void start();
    // Stops ticking and empties the roster. The pulse may be started again.
    void stop();
    [[nodiscard]] PulseState state() const noexcept { return state_; }

    void register_combatant(const ActorId actor);
    void unregister_combatant(const ActorId actor);
    [[nodiscard]] bool is_registered(const ActorId actor) const { return roster_.contains(actor); }

    // Runs one pulse immediately. Normally called from the pulse's own timer.
    void tick();
    [[nodiscard]] PulseMetrics metrics() const;

private:
    void schedule_next();
    void process(const ActorId id, const Time now);
    void land_swing(Actor &attacker, CombatantTimingState &state);
    [[nodiscard]] bool is_idle(const CombatantTimingState &state, const Time now) const;
    void evict(const ActorId id, const CombatantTimingState &state, const Time now);

    World &world_;
    TimerQueue &timers_;
    CombatStates &states_;
    const TimingProvider &timing_;
    AttackResolver &resolver_;
    const PulseSettings settings_;
    EventSink &events_;
    Logger &logger_;
    PulseState state_{PulseState::Uninitialized};
    TimerToken next_tick_;
    std::unordered_set<ActorId> roster_;
    TickStatistics tick_stats_;
    uint64_t total_ticks_{};
    uint64_t throttle_events_{};
    uint64_t faults_{};
};
