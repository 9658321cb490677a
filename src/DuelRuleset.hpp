/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "DuelTypes.hpp"
#include "Types.hpp"

#include <cstddef>
#include <string_view>

class CombatPulse;

namespace Duels {

class DuelContext;

// Mechanics layered onto a duel. Every arena owns one; swapping rulesets changes how the fight
// plays without touching the duel lifecycle.
class DuelRuleset {
public:
    virtual ~DuelRuleset() = default;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    // Participants are in the arena and free to fight.
    virtual void on_begin(const DuelContext &context) = 0;
    // The fight is over, settlement has been made.
    virtual void on_complete(const DuelContext &context) = 0;
};

class StandardRuleset final : public DuelRuleset {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "standard"; }
    void on_begin(const DuelContext &) override {}
    void on_complete(const DuelContext &) override {}
};

// Puts the participants on the shared combat pulse for the length of the duel so their swings
// follow independent pulse driven timers.
class SphereRuleset final : public DuelRuleset {
public:
    explicit SphereRuleset(CombatPulse &pulse);
    [[nodiscard]] std::string_view name() const noexcept override { return "sphere"; }
    void on_begin(const DuelContext &context) override;
    void on_complete(const DuelContext &context) override;

private:
    CombatPulse &pulse_;
};

// Gold held against duels.
struct GoldLedger {
    virtual ~GoldLedger() = default;
    // Takes |amount| from the actor into escrow. Returns false, taking nothing, if they can't cover it.
    virtual bool debit(const ActorId actor, const int amount) = 0;
    // Hands back escrowed gold.
    virtual void refund(const ActorId actor, const int amount) = 0;
    // Pays out winnings.
    virtual void credit(const ActorId actor, const int amount) = 0;
};

// The world side of an arena: moving people in and out and keeping duel deaths from counting
// against anyone.
struct ArenaServices {
    virtual ~ArenaServices() = default;
    virtual void lock_region(const Arena &arena) = 0;
    virtual void release_region(const Arena &arena) = 0;
    virtual void move_to_arena(const ActorId actor, const Arena &arena, const size_t spawn_index) = 0;
    virtual void return_from_arena(const ActorId actor, const Arena &arena) = 0;
    virtual void restore(const ActorId actor) = 0;
    // Removes fame, karma and aggression consequences between two duellists.
    virtual void clear_scoring(const ActorId victim, const ActorId killer) = 0;
};

}
