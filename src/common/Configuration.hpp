#pragma once

#include "CombatPolicy.hpp"

#include <stdexcept>
#include <string>

/**
 * Environment variables read by Configuration. All of them are optional.
 */
static inline constexpr auto SKIRMISH_TICK_MS_ENV = "SKIRMISH_TICK_MS";
static inline constexpr auto SKIRMISH_IDLE_TIMEOUT_MS_ENV = "SKIRMISH_IDLE_TIMEOUT_MS";
static inline constexpr auto SKIRMISH_TIMING_PROVIDER_ENV = "SKIRMISH_TIMING_PROVIDER";
static inline constexpr auto SKIRMISH_INDEPENDENT_TIMERS_ENV = "SKIRMISH_INDEPENDENT_TIMERS";
static inline constexpr auto SKIRMISH_SPELL_CANCELS_SWING_ENV = "SKIRMISH_SPELL_CANCELS_SWING";
static inline constexpr auto SKIRMISH_SWING_CANCELS_SPELL_ENV = "SKIRMISH_SWING_CANCELS_SPELL";
static inline constexpr auto SKIRMISH_SWING_BLOCKS_CAST_ENV = "SKIRMISH_SWING_BLOCKS_CAST";
static inline constexpr auto SKIRMISH_DISABLE_SWING_DURING_CAST_ENV = "SKIRMISH_DISABLE_SWING_DURING_CAST";
static inline constexpr auto SKIRMISH_DISABLE_SWING_DURING_CAST_DELAY_ENV = "SKIRMISH_DISABLE_SWING_DURING_CAST_DELAY";
static inline constexpr auto SKIRMISH_BANDAGE_CANCELS_ACTIONS_ENV = "SKIRMISH_BANDAGE_CANCELS_ACTIONS";
static inline constexpr auto SKIRMISH_ACTION_CANCELS_BANDAGE_ENV = "SKIRMISH_ACTION_CANCELS_BANDAGE";
static inline constexpr auto SKIRMISH_WAND_CANCELS_ACTIONS_ENV = "SKIRMISH_WAND_CANCELS_ACTIONS";
static inline constexpr auto SKIRMISH_REMOVE_POST_CAST_RECOVERY_ENV = "SKIRMISH_REMOVE_POST_CAST_RECOVERY";
static inline constexpr auto SKIRMISH_DAMAGE_INTERRUPTS_CAST_ENV = "SKIRMISH_DAMAGE_INTERRUPTS_CAST";
static inline constexpr auto SKIRMISH_PARTIAL_MANA_PERCENT_ENV = "SKIRMISH_PARTIAL_MANA_PERCENT";
static inline constexpr auto SKIRMISH_MIN_CAST_DELAY_MS_ENV = "SKIRMISH_MIN_CAST_DELAY_MS";
static inline constexpr auto SKIRMISH_MAX_CAST_DELAY_MS_ENV = "SKIRMISH_MAX_CAST_DELAY_MS";
static inline constexpr auto SKIRMISH_MIN_SWING_MS_ENV = "SKIRMISH_MIN_SWING_MS";
static inline constexpr auto SKIRMISH_MAX_SWING_MS_ENV = "SKIRMISH_MAX_SWING_MS";
static inline constexpr auto SKIRMISH_DEBUG_LOGGING_ENV = "SKIRMISH_DEBUG_LOGGING";
static inline constexpr auto SKIRMISH_LOG_CANCELLATIONS_ENV = "SKIRMISH_LOG_CANCELLATIONS";
static inline constexpr auto SKIRMISH_LOG_TIMER_CHANGES_ENV = "SKIRMISH_LOG_TIMER_CHANGES";

// Raised for a malformed or out of range setting. The engine refuses to start with one.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * Combat and pulse settings sourced from the environment. Construction validates
 * everything up front so that a running engine never sees undefined timings.
 */
class Configuration {
public:
    Configuration();
    [[nodiscard]] const CombatPolicy &combat_policy() const noexcept { return policy_; }
    [[nodiscard]] const PulseSettings &pulse_settings() const noexcept { return pulse_; }
    [[nodiscard]] TimingProviderKind timing_provider() const noexcept { return timing_provider_; }
    [[nodiscard]] bool debug_logging() const noexcept { return debug_logging_; }
    [[nodiscard]] bool log_cancellations() const noexcept { return log_cancellations_; }
    [[nodiscard]] bool log_timer_changes() const noexcept { return log_timer_changes_; }

private:
    [[nodiscard]] static int int_env(const std::string &envkey, const int default_value);
    [[nodiscard]] static bool bool_env(const std::string &envkey, const bool default_value);
    [[nodiscard]] static Millis millis_env(const std::string &envkey, const Millis default_value);
    void validate() const;

    CombatPolicy policy_;
    PulseSettings pulse_;
    TimingProviderKind timing_provider_{TimingProviderKind::WeaponTable};
    bool debug_logging_{};
    bool log_cancellations_{};
    bool log_timer_changes_{};
};
