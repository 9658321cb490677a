/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Actor.hpp"
#include "Weapon.hpp"
#include "common/CombatPolicy.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>

// Swing timings derived for one actor and weapon. Recomputed whenever it's needed and never
// cached, so equipment and stat changes take effect on the next swing.
struct TimingSnapshot {
    int attack_interval_ms;
    int animation_hit_offset_ms;
    int animation_duration_ms;
};

// Maps an actor and the weapon they wield to swing timings. Implementations are stateless once
// constructed and never throw: anything they don't recognise gets a default.
class TimingProvider {
public:
    virtual ~TimingProvider() = default;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    // |attacker| may be null, |weapon| is null when unarmed.
    [[nodiscard]] virtual int attack_interval_ms(const Actor *attacker, const Weapon *weapon) const noexcept = 0;
    [[nodiscard]] virtual int animation_hit_offset_ms(const Weapon *weapon) const noexcept = 0;
    [[nodiscard]] virtual int animation_duration_ms(const Weapon *weapon) const noexcept = 0;

    [[nodiscard]] TimingSnapshot snapshot(const Actor &attacker) const noexcept;
};

struct WeaponTimingEntry {
    int speed;
    int hit_offset_ms;
    int duration_ms;
};

// Table driven timings: a row per weapon class plus rows for specific items. The interval
// scales with the attacker's dexterity and lands on a 50ms boundary.
class WeaponTableTimingProvider final : public TimingProvider {
public:
    static inline constexpr int DexBaseline = 100;
    static inline constexpr int MaxDexBonus = 25;
    static inline constexpr int MaxDexPenalty = -50;
    static inline constexpr double HighDexModifier = 0.008;
    static inline constexpr double LowDexModifier = 0.004;
    static inline constexpr int MsPerSpeedPoint = 40;
    static inline constexpr int GranularityMs = 50;
    static inline constexpr int MinIntervalMs = 200;
    static inline constexpr int MaxIntervalMs = 4000;

    WeaponTableTimingProvider();
    // |item_overrides| replace or extend the built in per-item rows.
    explicit WeaponTableTimingProvider(const std::unordered_map<uint32_t, WeaponTimingEntry> &item_overrides);

    [[nodiscard]] std::string_view name() const noexcept override { return "weapon table"; }
    [[nodiscard]] int attack_interval_ms(const Actor *attacker, const Weapon *weapon) const noexcept override;
    [[nodiscard]] int animation_hit_offset_ms(const Weapon *weapon) const noexcept override;
    [[nodiscard]] int animation_duration_ms(const Weapon *weapon) const noexcept override;

    [[nodiscard]] static WeaponTimingEntry class_defaults(const WeaponClass weapon_class) noexcept;

private:
    [[nodiscard]] WeaponTimingEntry entry_for(const Weapon *weapon) const noexcept;

    std::unordered_map<uint32_t, WeaponTimingEntry> items_;
};

// The classic speed formula: 15000 / ((stamina + 100) * speed) seconds, bounded by the
// configured swing limits. Animation timings come from the weapon class table.
class LegacyTimingProvider final : public TimingProvider {
public:
    static inline constexpr int NoAttackerIntervalMs = 700;
    static inline constexpr int UnarmedIntervalMs = 1500;

    LegacyTimingProvider(Millis min_interval, Millis max_interval);

    [[nodiscard]] std::string_view name() const noexcept override { return "legacy"; }
    [[nodiscard]] int attack_interval_ms(const Actor *attacker, const Weapon *weapon) const noexcept override;
    [[nodiscard]] int animation_hit_offset_ms(const Weapon *weapon) const noexcept override;
    [[nodiscard]] int animation_duration_ms(const Weapon *weapon) const noexcept override;

private:
    int min_interval_ms_;
    int max_interval_ms_;
};

[[nodiscard]] std::unique_ptr<const TimingProvider> make_timing_provider(const TimingProviderKind kind,
                                                                         const CombatPolicy &policy);
