/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "CombatEvents.hpp"
#include "DuelContext.hpp"
#include "DuelRuleset.hpp"
#include "Logging.hpp"
#include "TimerQueue.hpp"
#include "World.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace Duels {

struct DuelSettings {
    Seconds challenge_timeout{30};
    Seconds countdown{10};
    Minutes match_timeout{30};
    Seconds loot_phase{120};
    Seconds cleanup_delay{5};
    // Share of the pot paid out to the winners; the house keeps the rest.
    int payout_percent{90};
    size_t history_limit{100};
};

// An invitation to duel, keyed by the challenged actor. The wager is already in escrow.
struct PendingChallenge {
    ActorId initiator;
    ActorId target;
    ArenaId arena;
    int wager;
    bool is_loot;
    Time created_at;
    uint64_t serial;
    TimerToken expiry;
};

// Challenges, escrow and the lifecycle of every arena's duel:
//   Pending -> Waiting -> Countdown -> InProgress -> Ending [-> LootPhase] -> Completed
// Lookups of actors or duels that have gone away are quietly ignored, as disconnects can race
// with everything else here.
class DuelSystem {
public:
    DuelSystem(World &world, TimerQueue &timers, GoldLedger &ledger, ArenaServices &services, EventSink &events,
               Logger &logger, DuelSettings settings = {});
    ~DuelSystem();
    DuelSystem(const DuelSystem &) = delete;
    DuelSystem &operator=(const DuelSystem &) = delete;

    void add_arena(Arena arena, std::unique_ptr<DuelRuleset> ruleset);

    // Each returns a message for the acting player when the request is refused.
    std::optional<std::string> issue_challenge(const ActorId initiator, const ActorId target, const ArenaId arena,
                                               const int wager, const bool is_loot);
    std::optional<std::string> accept_challenge(const ActorId target);
    void decline_challenge(const ActorId target);
    // Fills the remaining places in a team duel.
    std::optional<std::string> join_duel(const ArenaId arena, const ActorId actor);

    void begin_duel(DuelContext &context);
    // An empty winner is a draw. Only the first call for a duel has any effect.
    void end_duel(DuelContext &context, const std::optional<ActorId> winner);

    void on_death(const ActorId victim, const std::optional<ActorId> killer);
    void on_disconnect(const ActorId actor);

    [[nodiscard]] const PendingChallenge *pending_challenge(const ActorId target) const;
    [[nodiscard]] DuelContext *active_duel(const ArenaId arena);
    [[nodiscard]] DuelContext *duel_of(const ActorId actor);
    [[nodiscard]] const std::deque<DuelResult> &history() const noexcept { return history_; }

private:
    struct ArenaSlot {
        Arena arena;
        std::unique_ptr<DuelRuleset> ruleset;
        std::unique_ptr<DuelContext> context;
    };

    [[nodiscard]] std::optional<std::string> validate_duellists(const ActorId initiator, const ActorId target);
    [[nodiscard]] bool can_duel(const ActorId actor);
    // Removes the challenge and hands the initiator their wager back.
    void withdraw_challenge(const ActorId target, const Events::ChallengeOutcome outcome);
    void expire_challenge(const ActorId target, const uint64_t serial);
    void change_state(DuelContext &context, const DuelState state);
    void start_countdown(DuelContext &context);
    void countdown_tick(const ArenaId arena, const uint64_t serial);
    [[nodiscard]] DuelContext *live_context(const ArenaId arena, const uint64_t serial);
    void settle(DuelContext &context, const std::vector<ActorId> &winners);
    void cleanup(const ArenaId arena, const uint64_t serial);
    void cancel_duel(DuelContext &context, std::string_view reason);
    void archive(DuelContext &context, const DuelState final_state);

    World &world_;
    TimerQueue &timers_;
    GoldLedger &ledger_;
    ArenaServices &services_;
    EventSink &events_;
    Logger &logger_;
    const DuelSettings settings_;
    std::unordered_map<ActorId, PendingChallenge> challenges_;
    // Initiator to the actor they challenged.
    std::unordered_map<ActorId, ActorId> outgoing_;
    std::unordered_map<ArenaId, ArenaSlot> arenas_;
    std::deque<DuelResult> history_;
    uint64_t next_serial_{1};
};

}
