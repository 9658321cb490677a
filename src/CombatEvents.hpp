/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "CombatTypes.hpp"
#include "DuelTypes.hpp"
#include "Types.hpp"
#include "common/Time.hpp"

#include <string>
#include <variant>
#include <vector>

// Structured notifications for the presentation layer. The engine never formats text for
// players; sinks decide how (and whether) to render these.
namespace Events {

struct ActionRejected {
    ActorId actor;
    ActionKind action;
    ActionError error;
    std::string reason;
};

struct ActionCancelled {
    ActorId actor;
    ActionKind action;
    std::string reason;
};

struct CastDelayStarted {
    ActorId caster;
    std::string spell;
    Millis delay;
};

struct CastApplied {
    ActorId caster;
    ActorId target;
    std::string spell;
};

struct CastFizzled {
    ActorId caster;
    std::string spell;
    ActionError error;
    std::string reason;
};

struct CastInterrupted {
    ActorId caster;
    std::string spell;
    std::string reason;
};

// The target's reflection turned the spell back onto its caster.
struct SpellReflected {
    ActorId caster;
    ActorId target;
    std::string spell;
};

// A pulse took longer than its period.
struct Throttled {
    Millis tick_duration;
    Millis period;
};

struct ChallengeIssued {
    ActorId initiator;
    ActorId target;
    ArenaId arena;
    int wager;
    bool is_loot;
};

enum class ChallengeOutcome { Accepted, Declined, Expired, Withdrawn };

struct ChallengeClosed {
    ActorId initiator;
    ActorId target;
    ChallengeOutcome outcome;
};

struct DuelStateChanged {
    ArenaId arena;
    Duels::DuelState from;
    Duels::DuelState to;
};

struct DuelCountdown {
    ArenaId arena;
    int seconds_remaining;
};

struct DuelEnded {
    Duels::DuelResult result;
};

}

using Event = std::variant<Events::ActionRejected, Events::ActionCancelled, Events::CastDelayStarted,
                           Events::CastApplied, Events::CastFizzled, Events::CastInterrupted, Events::SpellReflected,
                           Events::Throttled, Events::ChallengeIssued, Events::ChallengeClosed,
                           Events::DuelStateChanged, Events::DuelCountdown, Events::DuelEnded>;

struct EventSink {
    virtual ~EventSink() = default;
    virtual void publish(const Event &event) = 0;
};
