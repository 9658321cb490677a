/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <string>

// The actions that carry their own recovery timer.
enum class ActionKind { Swing, Cast, Bandage, Wand };

enum class ActionError {
    // Refused by the cross-cancellation policy or a recovery that hasn't elapsed.
    ActionBlocked,
    // Not enough mana or reagents when the cast commits.
    InsufficientResources,
    // The target went away or out of sight before the effect landed.
    TargetInvalid
};

// Why an action was refused. These are reported to the acting player, not treated as faults.
struct Rejection {
    ActionError error;
    std::string reason;
};
