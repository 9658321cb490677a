/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "SpellTiming.hpp"

#include <algorithm>
#include <cctype>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

namespace {

std::string key_for(std::string_view spell_name) {
    return spell_name | ranges::views::transform([](unsigned char c) { return static_cast<char>(std::tolower(c)); })
           | ranges::to<std::string>;
}

constexpr double MaxSkillReduction = 0.5;

}

int SpellTimingData::delay_ms(const double skill, const bool from_scroll, const int tiles,
                              const int targets) const noexcept {
    auto delay = base_delay_ms;
    if (per_tile_delay_ms > 0 && tiles > 0)
        delay += per_tile_delay_ms * tiles;
    if (per_target_delay_ms > 0 && targets > 1)
        delay += per_target_delay_ms * (targets - 1);
    if (!from_scroll && skill > 0) {
        const auto reduction = std::min(skill / 10.0, MaxSkillReduction);
        delay = static_cast<int>(delay * (1.0 - reduction));
    }
    if (max_delay_ms > 0)
        delay = std::min(delay, max_delay_ms);
    return std::max(delay, 0);
}

SpellTimingTable::SpellTimingTable() {
    set("Explosion", {.base_delay_ms = 2500, .per_tile_delay_ms = 100, .max_delay_ms = 5000});
    set("ChainLightning", {.base_delay_ms = 1800, .per_target_delay_ms = 200, .max_delay_ms = 4000});
    set("MeteorSwarm", {.base_delay_ms = 2500, .per_tile_delay_ms = 150, .max_delay_ms = 6000});
    for (auto field : {"EnergyField", "FireField", "PoisonField", "ParalyzeField"})
        set(field, {.base_delay_ms = 1800});
}

void SpellTimingTable::set(std::string_view spell_name, const SpellTimingData &data) {
    rows_.insert_or_assign(key_for(spell_name), data);
}

const SpellTimingData *SpellTimingTable::find(std::string_view spell_name) const {
    if (auto it = rows_.find(key_for(spell_name)); it != rows_.end())
        return &it->second;
    return nullptr;
}

Millis SpellTimingTable::cast_delay(std::string_view spell_name, const double skill, const bool from_scroll,
                                    const int tiles, const int targets) const {
    if (const auto *data = find(spell_name))
        return Millis(data->delay_ms(skill, from_scroll, tiles, targets));
    return Millis::zero();
}
