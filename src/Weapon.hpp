/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <cstdint>
#include <string>

// Animation class of a weapon; selects the default timing row when an item has no entry of
// its own.
enum class WeaponClass { Default, Dagger, OneHandedSword, TwoHanded, Bow, Crossbow };

struct Weapon {
    uint32_t item_id{};
    WeaponClass weapon_class{WeaponClass::Default};
    // Classic speed rating, higher is faster. Only the legacy formula reads this.
    int speed{};
    std::string name;
};
