/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "CombatEvents.hpp"
#include "CombatantTimingState.hpp"
#include "Logging.hpp"
#include "SpellTiming.hpp"
#include "TimerQueue.hpp"
#include "World.hpp"

#include <optional>
#include <string>
#include <string_view>

// Drives a spell from target confirmation to its effect:
//   AwaitingTarget -> ResourceCommit -> Delaying -> Resolving -> Applied | Fizzled | Interrupted
// Mana and reagents are taken once, at ResourceCommit, and are forfeit if the cast is later
// interrupted. Casts are strictly sequential per caster.
class CastPipeline {
public:
    static inline constexpr auto MagerySkill = "magery";

    CastPipeline(World &world, CombatStates &states, TimerQueue &timers, const SpellTimingTable &spell_timing,
                 EventSink &events, Logger &logger);

    // Starts a cast awaiting its target. An unresolved earlier cast fizzles first.
    std::optional<Rejection> begin_cast(const ActorId caster, Spell &spell, const bool from_scroll = false);
    // Commits resources and starts the cast delay. Ignored unless a cast is awaiting a target.
    void confirm_target(const ActorId caster, const ActorId target);
    // The caster can no longer cast (death, logout, cancelled targeting).
    void abort(const ActorId caster, std::string_view reason);
    void on_caster_damaged(const ActorId caster);

    [[nodiscard]] std::optional<CastStatus> status(const ActorId caster);

private:
    void commit(CombatantTimingState &state, CastDescriptor &cast, Actor &caster, const Time now);
    void resolve(const ActorId caster, const uint64_t serial);
    void fizzle(CombatantTimingState &state, const ActionError error, std::string reason, const Time now);
    [[nodiscard]] Millis cast_delay(const CastDescriptor &cast, const Actor &caster) const;

    World &world_;
    CombatStates &states_;
    TimerQueue &timers_;
    const SpellTimingTable &spell_timing_;
    EventSink &events_;
    Logger &logger_;
};
