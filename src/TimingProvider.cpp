/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "TimingProvider.hpp"

#include <algorithm>
#include <cmath>

namespace {

// Item ids with their own timing rows.
constexpr uint32_t Katana = 0x13FF;
constexpr uint32_t Longsword = 0x13B8;
constexpr uint32_t Halberd = 0x143E;
constexpr uint32_t Bow = 0x13B1;

const std::unordered_map<uint32_t, WeaponTimingEntry> &builtin_items() {
    static const std::unordered_map<uint32_t, WeaponTimingEntry> items{
        {Katana, {46, 300, 600}},
        {Longsword, {30, 300, 600}},
        {Halberd, {25, 400, 800}},
        {Bow, {30, 500, 900}},
    };
    return items;
}

}

TimingSnapshot TimingProvider::snapshot(const Actor &attacker) const noexcept {
    const auto *weapon = attacker.weapon();
    return {attack_interval_ms(&attacker, weapon), animation_hit_offset_ms(weapon), animation_duration_ms(weapon)};
}

WeaponTableTimingProvider::WeaponTableTimingProvider() : items_(builtin_items()) {}

WeaponTableTimingProvider::WeaponTableTimingProvider(
    const std::unordered_map<uint32_t, WeaponTimingEntry> &item_overrides)
    : items_(builtin_items()) {
    for (const auto &[item_id, entry] : item_overrides)
        items_.insert_or_assign(item_id, entry);
}

WeaponTimingEntry WeaponTableTimingProvider::class_defaults(const WeaponClass weapon_class) noexcept {
    switch (weapon_class) {
    case WeaponClass::Dagger: return {20, 200, 400};
    case WeaponClass::OneHandedSword: return {35, 300, 600};
    case WeaponClass::TwoHanded: return {75, 400, 800};
    case WeaponClass::Bow: return {45, 500, 900};
    case WeaponClass::Crossbow: return {50, 600, 1100};
    case WeaponClass::Default: break;
    }
    return {50, 300, 600};
}

WeaponTimingEntry WeaponTableTimingProvider::entry_for(const Weapon *weapon) const noexcept {
    if (!weapon)
        return class_defaults(WeaponClass::Default);
    if (auto it = items_.find(weapon->item_id); it != items_.end())
        return it->second;
    return class_defaults(weapon->weapon_class);
}

int WeaponTableTimingProvider::attack_interval_ms(const Actor *attacker, const Weapon *weapon) const noexcept {
    if (!attacker)
        return MinIntervalMs;
    const auto base_ms = entry_for(weapon).speed * MsPerSpeedPoint;
    // NPCs swing at the base rate whatever their dexterity.
    const auto dex_bonus =
        attacker->is_player() ? std::clamp(attacker->dex() - DexBaseline, MaxDexPenalty, MaxDexBonus) : 0;
    auto multiplier = 1.0;
    if (dex_bonus > 0)
        multiplier -= dex_bonus * HighDexModifier;
    else if (dex_bonus < 0)
        multiplier -= dex_bonus * LowDexModifier;
    const auto steps = std::nearbyint(base_ms * multiplier / GranularityMs);
    return std::clamp(static_cast<int>(steps) * GranularityMs, MinIntervalMs, MaxIntervalMs);
}

int WeaponTableTimingProvider::animation_hit_offset_ms(const Weapon *weapon) const noexcept {
    return entry_for(weapon).hit_offset_ms;
}

int WeaponTableTimingProvider::animation_duration_ms(const Weapon *weapon) const noexcept {
    return entry_for(weapon).duration_ms;
}

LegacyTimingProvider::LegacyTimingProvider(Millis min_interval, Millis max_interval)
    : min_interval_ms_(static_cast<int>(min_interval.count())),
      max_interval_ms_(static_cast<int>(max_interval.count())) {}

int LegacyTimingProvider::attack_interval_ms(const Actor *attacker, const Weapon *weapon) const noexcept {
    if (!attacker)
        return NoAttackerIntervalMs;
    if (!weapon)
        return UnarmedIntervalMs;
    const auto divisor = std::max((attacker->stamina() + 100) * weapon->speed, 1);
    const auto interval_ms = static_cast<int>(15'000'000.0 / divisor);
    return std::clamp(interval_ms, min_interval_ms_, max_interval_ms_);
}

int LegacyTimingProvider::animation_hit_offset_ms(const Weapon *weapon) const noexcept {
    return WeaponTableTimingProvider::class_defaults(weapon ? weapon->weapon_class : WeaponClass::Default)
        .hit_offset_ms;
}

int LegacyTimingProvider::animation_duration_ms(const Weapon *weapon) const noexcept {
    return WeaponTableTimingProvider::class_defaults(weapon ? weapon->weapon_class : WeaponClass::Default)
        .duration_ms;
}

std::unique_ptr<const TimingProvider> make_timing_provider(const TimingProviderKind kind,
                                                           const CombatPolicy &policy) {
    switch (kind) {
    case TimingProviderKind::Legacy:
        return std::make_unique<LegacyTimingProvider>(policy.min_swing_interval, policy.max_swing_interval);
    case TimingProviderKind::WeaponTable: break;
    }
    return std::make_unique<WeaponTableTimingProvider>();
}
