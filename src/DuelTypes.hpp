/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Types.hpp"
#include "common/Time.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace Duels {

enum class DuelType { Money1v1, Money2v2, Loot1v1, Loot2v2 };

[[nodiscard]] constexpr bool is_team_duel(const DuelType type) noexcept {
    return type == DuelType::Money2v2 || type == DuelType::Loot2v2;
}
[[nodiscard]] constexpr bool is_loot_duel(const DuelType type) noexcept {
    return type == DuelType::Loot1v1 || type == DuelType::Loot2v2;
}
[[nodiscard]] constexpr size_t capacity(const DuelType type) noexcept { return is_team_duel(type) ? 4u : 2u; }

// Pending is only ever held by a challenge. A DuelContext starts life in Waiting.
enum class DuelState { Pending, Waiting, Countdown, InProgress, Ending, LootPhase, Completed, Cancelled };

struct DuelParticipant {
    ActorId actor;
    int team;
    int kills{};
    int deaths{};
    bool eliminated{};
    // Gold held in escrow for this participant.
    int stake{};
};

struct Arena {
    ArenaId id;
    std::string name;
    DuelType type;
};

// Archived once a duel is over. An empty winners list is a draw.
struct DuelResult {
    ArenaId arena;
    DuelType type;
    std::vector<ActorId> winners;
    std::vector<ActorId> losers;
    std::vector<DuelParticipant> participants;
    Millis duration;
    int pot;
    Time ended_at;
};

}
