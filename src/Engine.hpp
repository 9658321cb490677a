/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "CastPipeline.hpp"
#include "CombatEvents.hpp"
#include "CombatPulse.hpp"
#include "CombatantTimingState.hpp"
#include "DuelSystem.hpp"
#include "Logging.hpp"
#include "SpellTiming.hpp"
#include "TimerQueue.hpp"
#include "TimingProvider.hpp"
#include "World.hpp"
#include "common/Configuration.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>

/**
 * Everything the combat timing and duel code needs, wired together from one Configuration.
 * The game owns the Engine and drives it either with run_for() or by calling poll() from its own
 * loop; either way every timer and pulse runs on the calling thread.
 */
class Engine {
public:
    Engine(const Configuration &config, World &world, AttackResolver &resolver, Duels::GoldLedger &ledger,
           Duels::ArenaServices &arena_services, EventSink &events, Logger &logger);
    ~Engine();
    Engine(const Engine &) = delete;
    Engine(Engine &&) = delete;
    Engine &operator=(const Engine &) = delete;
    Engine &operator=(Engine &&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return pulse_.state() == PulseState::Running; }

    // Sleeps until each timer falls due and runs it, returning once |duration| has passed or the
    // engine has been stopped.
    void run_for(const Millis duration);
    // Runs whatever is due now without waiting. Returns the number of callbacks run.
    size_t poll();

    // Player initiated actions. A refusal is also published as ActionRejected.
    std::optional<Rejection> request_bandage(const ActorId actor, const Millis duration);
    std::optional<Rejection> request_wand(const ActorId actor, const Millis recovery);
    bool cancel(const ActorId actor, const ActionKind kind, std::string_view reason);

    // The actor has left the world: challenges, duels, casts and timers are all let go.
    void remove_actor(const ActorId actor);

    [[nodiscard]] CombatPulse &pulse() noexcept { return pulse_; }
    [[nodiscard]] CastPipeline &casts() noexcept { return casts_; }
    [[nodiscard]] Duels::DuelSystem &duels() noexcept { return duels_; }
    [[nodiscard]] CombatStates &states() noexcept { return states_; }
    [[nodiscard]] SpellTimingTable &spell_timing() noexcept { return spell_timing_; }
    [[nodiscard]] const TimingProvider &timing() const noexcept { return *timing_; }
    [[nodiscard]] TimerQueue &timers() noexcept { return timers_; }

private:
    std::optional<Rejection> published(const ActorId actor, const ActionKind kind,
                                       std::optional<Rejection> rejection);

    World &world_;
    EventSink &events_;
    Logger &logger_;
    TimerQueue timers_;
    CombatStates states_;
    std::unique_ptr<const TimingProvider> timing_;
    SpellTimingTable spell_timing_;
    CombatPulse pulse_;
    CastPipeline casts_;
    Duels::DuelSystem duels_;
    // When each actor's current bandage finishes.
    std::unordered_map<ActorId, TimerToken> bandages_;
};
