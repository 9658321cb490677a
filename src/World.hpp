/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Actor.hpp"
#include "common/Time.hpp"

// Lookup into the world's actor registry. Timers and rosters keep ActorIds and resolve them
// here when they fire, so nothing in the engine extends an actor's lifetime.
struct World {
    virtual ~World() = default;
    // Returns nullptr once the actor has gone.
    virtual Actor *find_actor(ActorId id) = 0;
    virtual Time current_time() const = 0;
};
