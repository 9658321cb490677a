#pragma once

#include "Time.hpp"

// Cross-cancellation and recovery toggles. Read once at startup and handed to the
// engine by value; nothing mutates a policy once combat has started.
struct CombatPolicy {
    // Swing, cast, bandage and wand each keep their own recovery. When false every action
    // shares a single next-action time.
    bool independent_timers{true};
    bool spell_cancels_swing{true};
    bool swing_cancels_spell{true};
    // Beginning a cast is refused while a swing is pending.
    bool swing_blocks_cast{false};
    // Swings are refused while a cast is awaiting its target. Takes precedence over
    // swing_cancels_spell.
    bool disable_swing_during_cast{true};
    // As above, but while the cast is in its delay phase.
    bool disable_swing_during_cast_delay{true};
    bool bandage_cancels_actions{false};
    bool action_cancels_bandage{false};
    bool wand_cancels_actions{true};
    bool remove_post_cast_recovery{true};
    bool damage_interrupts_cast{false};
    // Share of a spell's mana taken when resources are committed; the rest is taken when
    // the spell resolves.
    int partial_mana_percent{100};
    Millis post_cast_recovery{1000};
    Millis min_cast_delay{0};
    Millis max_cast_delay{10000};
    Millis min_swing_interval{500};
    Millis max_swing_interval{10000};
};

struct PulseSettings {
    Millis tick_period{50};
    Millis idle_timeout{5000};
};

enum class TimingProviderKind { WeaponTable, Legacy };
