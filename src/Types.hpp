#pragma once

#include <cstdint>

// Identity of an actor in the world. Ids are never reused for the lifetime of the process so
// a stale id simply fails to resolve.
using ActorId = uint64_t;

// Identity of a duel arena.
using ArenaId = uint32_t;
