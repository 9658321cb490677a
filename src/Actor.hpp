/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Types.hpp"
#include "Weapon.hpp"

#include <optional>
#include <string_view>

// The narrow view of a game character that combat timing and duels need. The rest of the
// object model (inventory, equipment, skills tables) stays behind this interface.
class Actor {
public:
    virtual ~Actor() = default;
    [[nodiscard]] virtual ActorId id() const = 0;
    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual bool is_player() const = 0;
    [[nodiscard]] virtual bool is_alive() const = 0;
    // Set once the actor has been removed from the world but something may still hold its id.
    [[nodiscard]] virtual bool is_deleted() const = 0;
    [[nodiscard]] virtual int dex() const = 0;
    [[nodiscard]] virtual int stamina() const = 0;
    // The equipped weapon, or nullptr when fighting unarmed.
    [[nodiscard]] virtual const Weapon *weapon() const = 0;
    [[nodiscard]] virtual int skill(std::string_view skill_name) const = 0;
    [[nodiscard]] virtual int mana() const = 0;
    virtual void set_mana(int mana) = 0;
    [[nodiscard]] virtual bool in_line_of_sight(const Actor &other) const = 0;
    // Who the actor is currently fighting, if anyone.
    [[nodiscard]] virtual std::optional<ActorId> opponent() const = 0;
};
