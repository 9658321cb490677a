/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Actor.hpp"

#include <string_view>

// A spell definition as the cast pipeline sees it. The definitions themselves, and whatever
// the effect does, live with the game data.
class Spell {
public:
    virtual ~Spell() = default;
    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual int mana_cost() const = 0;
    // Takes the reagents from |caster|. Returns false without taking anything when any are missing.
    virtual bool consume_reagents(Actor &caster) = 0;
    // Whether |target| is currently protected by a reflection effect.
    [[nodiscard]] virtual bool has_reflection(const Actor &target) const = 0;
    virtual void apply_effect(Actor &caster, Actor &target) = 0;
    [[nodiscard]] virtual bool needs_line_of_sight() const { return true; }
};
