/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "CombatPulse.hpp"

#include <exception>
#include <magic_enum.hpp>
#include <vector>

namespace {

bool can_fight(const Actor *actor) { return actor && !actor->is_deleted() && actor->is_alive(); }

}

CombatPulse::CombatPulse(World &world, TimerQueue &timers, CombatStates &states, const TimingProvider &timing,
                         AttackResolver &resolver, const PulseSettings &settings, EventSink &events, Logger &logger)
    : world_(world), timers_(timers), states_(states), timing_(timing), resolver_(resolver), settings_(settings),
      events_(events), logger_(logger) {}

CombatPulse::~CombatPulse() { next_tick_.cancel(); }

void CombatPulse::start() {
    if (state_ == PulseState::Running)
        return;
    state_ = PulseState::Running;
    logger_.log_string("Combat pulse started: {}ms period, {} timings, {}ms idle timeout",
                       settings_.tick_period.count(), timing_.name(), settings_.idle_timeout.count());
    schedule_next();
}

void CombatPulse::stop() {
    if (state_ != PulseState::Running)
        return;
    next_tick_.cancel();
    state_ = PulseState::Stopped;
    roster_.clear();
    logger_.log_string("Combat pulse stopped after {} ticks", total_ticks_);
}

void CombatPulse::schedule_next() {
    next_tick_ = timers_.schedule(world_.current_time() + settings_.tick_period, [this] {
        tick();
        if (state_ == PulseState::Running)
            schedule_next();
    });
}

void CombatPulse::register_combatant(const ActorId actor) {
    if (!roster_.insert(actor).second)
        return;
    states_.get_or_create(actor).touch(world_.current_time());
    logger_.log_new(LogChannel::Debug, "{} registered with the combat pulse", actor);
}

void CombatPulse::unregister_combatant(const ActorId actor) {
    if (roster_.erase(actor))
        logger_.log_new(LogChannel::Debug, "{} unregistered from the combat pulse", actor);
}

void CombatPulse::tick() {
    const auto started = std::chrono::steady_clock::now();
    const auto now = world_.current_time();
    // Swings can kill, and deaths can unregister actors, so walk a copy.
    const std::vector<ActorId> snapshot(roster_.begin(), roster_.end());
    for (const auto id : snapshot) {
        if (!roster_.contains(id))
            continue;
        try {
            process(id, now);
        } catch (const std::exception &e) {
            ++faults_;
            logger_.bug("Combat pulse skipped actor {} this tick: {}", id, e.what());
        }
    }
    const auto elapsed = std::chrono::duration_cast<Micros>(std::chrono::steady_clock::now() - started);
    tick_stats_.record(elapsed);
    ++total_ticks_;
    if (elapsed > settings_.tick_period) {
        ++throttle_events_;
        logger_.log_new(LogChannel::Performance, "Combat pulse took {}us for {} combatants, period is {}ms",
                        elapsed.count(), snapshot.size(), settings_.tick_period.count());
        events_.publish(Events::Throttled{std::chrono::duration_cast<Millis>(elapsed), settings_.tick_period});
    }
}

void CombatPulse::process(const ActorId id, const Time now) {
    auto *actor = world_.find_actor(id);
    if (!actor || actor->is_deleted()) {
        roster_.erase(id);
        states_.remove(id);
        return;
    }
    auto &state = states_.get_or_create(id);
    if (const auto hit_time = state.swing_hit_time()) {
        if (*hit_time <= now)
            land_swing(*actor, state);
        return;
    }
    if (actor->is_alive() && state.is_ready(ActionKind::Swing, now)) {
        const auto opponent = actor->opponent();
        if (opponent && can_fight(world_.find_actor(*opponent))) {
            const auto timing = timing_.snapshot(*actor);
            if (!state.begin_swing(timing, now) && timing.animation_hit_offset_ms <= 0)
                land_swing(*actor, state);
            return;
        }
    }
    if (is_idle(state, now))
        evict(id, state, now);
}

void CombatPulse::land_swing(Actor &attacker, CombatantTimingState &state) {
    state.complete_swing();
    const auto opponent = attacker.opponent();
    auto *defender = opponent ? world_.find_actor(*opponent) : nullptr;
    if (!can_fight(&attacker) || !can_fight(defender)) {
        logger_.log_new(LogChannel::Debug, "{} - swing landed on nobody", attacker.id());
        return;
    }
    resolver_.resolve_swing(attacker, *defender);
}

bool CombatPulse::is_idle(const CombatantTimingState &state, const Time now) const {
    return now - state.last_action_time() > settings_.idle_timeout && !state.active_cast();
}

void CombatPulse::evict(const ActorId id, const CombatantTimingState &state, const Time now) {
    roster_.erase(id);
    logger_.log_new(LogChannel::Debug, "{} evicted from the combat pulse after {}ms idle", id,
                    ms_between(state.last_action_time(), now));
    for (const auto kind : magic_enum::enum_values<ActionKind>())
        if (!state.is_ready(kind, now))
            return;
    states_.remove(id);
}

PulseMetrics CombatPulse::metrics() const {
    return {.average_tick = tick_stats_.average(),
            .max_tick = tick_stats_.maximum(),
            .p99_tick = tick_stats_.p99(),
            .total_ticks = total_ticks_,
            .active_combatants = roster_.size(),
            .throttle_events = throttle_events_,
            .faults = faults_,
            .period = settings_.tick_period};
}
