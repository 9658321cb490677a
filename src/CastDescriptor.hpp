/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Spell.hpp"
#include "TimerQueue.hpp"
#include "Types.hpp"
#include "common/Time.hpp"

#include <cstdint>
#include <optional>

enum class CastStatus { AwaitingTarget, ResourceCommit, Delaying, Resolving, Applied, Fizzled, Interrupted };

[[nodiscard]] constexpr bool is_terminal(const CastStatus status) noexcept {
    return status == CastStatus::Applied || status == CastStatus::Fizzled || status == CastStatus::Interrupted;
}

// One in-flight spell cast. Owned by the caster's CombatantTimingState; the delay timer only
// knows the caster's id and the serial, and finds its way back through them.
struct CastDescriptor {
    ActorId caster;
    Spell &spell;
    // Distinguishes successive casts by the same caster so a stale timer can spot it's stale.
    uint64_t serial;
    bool from_scroll{};
    CastStatus status{CastStatus::AwaitingTarget};
    // Weak: resolved through the World when the effect lands.
    std::optional<ActorId> target;
    bool resources_committed{};
    // Mana still owed when the effect lands, when only part was taken at commit.
    int mana_outstanding{};
    Time started_at;
    std::optional<Time> effect_time;
    TimerToken delay_timer;
};
