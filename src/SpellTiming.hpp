/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "common/Time.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

// Cast delay parameters for one spell.
struct SpellTimingData {
    int base_delay_ms{};
    int per_tile_delay_ms{};
    int per_target_delay_ms{};
    // Zero means uncapped.
    int max_delay_ms{};

    // Area spells take longer per tile covered and per extra target. Casting from a scroll
    // ignores the caster's skill.
    [[nodiscard]] int delay_ms(const double skill, const bool from_scroll, const int tiles = 0,
                               const int targets = 0) const noexcept;
};

// Spell delays keyed case-insensitively by spell name.
class SpellTimingTable {
public:
    // Populated with the built in delayed spells.
    SpellTimingTable();

    void set(std::string_view spell_name, const SpellTimingData &data);
    [[nodiscard]] const SpellTimingData *find(std::string_view spell_name) const;
    // Spells without a row resolve with no delay.
    [[nodiscard]] Millis cast_delay(std::string_view spell_name, const double skill, const bool from_scroll,
                                    const int tiles = 0, const int targets = 0) const;
    [[nodiscard]] size_t size() const noexcept { return rows_.size(); }

private:
    std::unordered_map<std::string, SpellTimingData> rows_;
};
