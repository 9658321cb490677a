/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "DuelTypes.hpp"
#include "TimerQueue.hpp"
#include "World.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace Duels {

class DuelRuleset;

// Outcome of checking a running duel for a winner.
struct Verdict {
    enum class Kind { Undecided, Winner, Draw };
    Kind kind;
    // Set for Winner. In team duels this is any surviving member of the winning team.
    std::optional<ActorId> winner;
};

// One duel in one arena, from acceptance until it's archived. Participants join in order and
// alternate between teams 0 and 1.
class DuelContext {
public:
    DuelContext(const Arena &arena, DuelRuleset &ruleset, const int wager, const uint64_t serial);
    DuelContext(const DuelContext &) = delete;
    DuelContext &operator=(const DuelContext &) = delete;

    [[nodiscard]] const Arena &arena() const noexcept { return arena_; }
    [[nodiscard]] DuelType type() const noexcept { return arena_.type; }
    [[nodiscard]] DuelRuleset &ruleset() const noexcept { return ruleset_; }
    [[nodiscard]] int wager() const noexcept { return wager_; }
    [[nodiscard]] bool is_loot() const noexcept { return is_loot_duel(arena_.type); }
    [[nodiscard]] uint64_t serial() const noexcept { return serial_; }
    [[nodiscard]] DuelState state() const noexcept { return state_; }
    void set_state(const DuelState state) noexcept { state_ = state; }
    // Ending, the loot phase and everything after.
    [[nodiscard]] bool is_over() const noexcept;

    [[nodiscard]] const std::vector<DuelParticipant> &participants() const noexcept { return participants_; }
    [[nodiscard]] DuelParticipant *find(const ActorId actor);
    [[nodiscard]] const DuelParticipant *find(const ActorId actor) const;
    DuelParticipant &add(const ActorId actor, const int stake);
    // Teams are reassigned so they stay balanced for whoever joins next.
    void remove(const ActorId actor);
    [[nodiscard]] bool is_full() const noexcept { return participants_.size() >= capacity(arena_.type); }
    [[nodiscard]] int pot() const noexcept;

    // Counts participants who are neither eliminated nor gone from the world.
    [[nodiscard]] Verdict evaluate(World &world) const;

    [[nodiscard]] std::optional<Time> started_at() const noexcept { return started_at_; }
    void mark_started(const Time now) noexcept { started_at_ = now; }

    int countdown_remaining{};
    // The countdown, loot or cleanup timer; whichever phase is current.
    TimerToken phase_timer;
    TimerToken match_timer;
    std::optional<DuelResult> result;

private:
    const Arena &arena_;
    DuelRuleset &ruleset_;
    const int wager_;
    const uint64_t serial_;
    DuelState state_{DuelState::Waiting};
    std::vector<DuelParticipant> participants_;
    std::optional<Time> started_at_;
};

}
