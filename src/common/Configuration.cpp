#include "Configuration.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/algorithm/contains.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
#include <string_view>

namespace {

std::string lower_case(std::string_view value) {
    return value | ranges::views::transform([](unsigned char c) { return static_cast<char>(std::tolower(c)); })
           | ranges::to<std::string>;
}

constexpr std::array<std::string_view, 4> TrueWords{"1", "true", "yes", "on"};
constexpr std::array<std::string_view, 4> FalseWords{"0", "false", "no", "off"};

}

Configuration::Configuration() {
    pulse_.tick_period = millis_env(SKIRMISH_TICK_MS_ENV, pulse_.tick_period);
    pulse_.idle_timeout = millis_env(SKIRMISH_IDLE_TIMEOUT_MS_ENV, pulse_.idle_timeout);
    if (const auto value = std::getenv(SKIRMISH_TIMING_PROVIDER_ENV)) {
        auto kind = magic_enum::enum_cast<TimingProviderKind>(value, magic_enum::case_insensitive);
        if (!kind) {
            throw ConfigurationError(fmt::format("{} must be one of {}, not '{}'", SKIRMISH_TIMING_PROVIDER_ENV,
                                                 fmt::join(magic_enum::enum_names<TimingProviderKind>(), "|"),
                                                 value));
        }
        timing_provider_ = *kind;
    }
    policy_.independent_timers = bool_env(SKIRMISH_INDEPENDENT_TIMERS_ENV, policy_.independent_timers);
    policy_.spell_cancels_swing = bool_env(SKIRMISH_SPELL_CANCELS_SWING_ENV, policy_.spell_cancels_swing);
    policy_.swing_cancels_spell = bool_env(SKIRMISH_SWING_CANCELS_SPELL_ENV, policy_.swing_cancels_spell);
    policy_.swing_blocks_cast = bool_env(SKIRMISH_SWING_BLOCKS_CAST_ENV, policy_.swing_blocks_cast);
    policy_.disable_swing_during_cast =
        bool_env(SKIRMISH_DISABLE_SWING_DURING_CAST_ENV, policy_.disable_swing_during_cast);
    policy_.disable_swing_during_cast_delay =
        bool_env(SKIRMISH_DISABLE_SWING_DURING_CAST_DELAY_ENV, policy_.disable_swing_during_cast_delay);
    policy_.bandage_cancels_actions = bool_env(SKIRMISH_BANDAGE_CANCELS_ACTIONS_ENV, policy_.bandage_cancels_actions);
    policy_.action_cancels_bandage = bool_env(SKIRMISH_ACTION_CANCELS_BANDAGE_ENV, policy_.action_cancels_bandage);
    policy_.wand_cancels_actions = bool_env(SKIRMISH_WAND_CANCELS_ACTIONS_ENV, policy_.wand_cancels_actions);
    policy_.remove_post_cast_recovery =
        bool_env(SKIRMISH_REMOVE_POST_CAST_RECOVERY_ENV, policy_.remove_post_cast_recovery);
    policy_.damage_interrupts_cast = bool_env(SKIRMISH_DAMAGE_INTERRUPTS_CAST_ENV, policy_.damage_interrupts_cast);
    policy_.partial_mana_percent = int_env(SKIRMISH_PARTIAL_MANA_PERCENT_ENV, policy_.partial_mana_percent);
    policy_.min_cast_delay = millis_env(SKIRMISH_MIN_CAST_DELAY_MS_ENV, policy_.min_cast_delay);
    policy_.max_cast_delay = millis_env(SKIRMISH_MAX_CAST_DELAY_MS_ENV, policy_.max_cast_delay);
    policy_.min_swing_interval = millis_env(SKIRMISH_MIN_SWING_MS_ENV, policy_.min_swing_interval);
    policy_.max_swing_interval = millis_env(SKIRMISH_MAX_SWING_MS_ENV, policy_.max_swing_interval);
    debug_logging_ = bool_env(SKIRMISH_DEBUG_LOGGING_ENV, false);
    log_cancellations_ = bool_env(SKIRMISH_LOG_CANCELLATIONS_ENV, false);
    log_timer_changes_ = bool_env(SKIRMISH_LOG_TIMER_CHANGES_ENV, false);
    validate();
}

void Configuration::validate() const {
    if (pulse_.tick_period <= Millis::zero()) {
        throw ConfigurationError(fmt::format("{} must be a positive number of milliseconds", SKIRMISH_TICK_MS_ENV));
    }
    if (pulse_.idle_timeout <= Millis::zero()) {
        throw ConfigurationError(
            fmt::format("{} must be a positive number of milliseconds", SKIRMISH_IDLE_TIMEOUT_MS_ENV));
    }
    if (policy_.partial_mana_percent < 0 || policy_.partial_mana_percent > 100) {
        throw ConfigurationError(fmt::format("{} must be between 0 and 100", SKIRMISH_PARTIAL_MANA_PERCENT_ENV));
    }
    if (policy_.min_cast_delay < Millis::zero() || policy_.min_cast_delay > policy_.max_cast_delay) {
        throw ConfigurationError(fmt::format("{} must not be negative or exceed {}", SKIRMISH_MIN_CAST_DELAY_MS_ENV,
                                             SKIRMISH_MAX_CAST_DELAY_MS_ENV));
    }
    if (policy_.min_swing_interval <= Millis::zero() || policy_.min_swing_interval > policy_.max_swing_interval) {
        throw ConfigurationError(fmt::format("{} must be positive and not exceed {}", SKIRMISH_MIN_SWING_MS_ENV,
                                             SKIRMISH_MAX_SWING_MS_ENV));
    }
}

int Configuration::int_env(const std::string &envkey, const int default_value) {
    const auto value = std::getenv(envkey.c_str());
    if (!value) {
        return default_value;
    }
    const std::string_view text{value};
    int result{};
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (error != std::errc{} || end != text.data() + text.size()) {
        throw ConfigurationError(fmt::format("{} must be an integer, not '{}'", envkey, text));
    }
    return result;
}

bool Configuration::bool_env(const std::string &envkey, const bool default_value) {
    const auto value = std::getenv(envkey.c_str());
    if (!value) {
        return default_value;
    }
    const auto lowered = lower_case(value);
    if (ranges::contains(TrueWords, std::string_view{lowered})) {
        return true;
    }
    if (ranges::contains(FalseWords, std::string_view{lowered})) {
        return false;
    }
    throw ConfigurationError(fmt::format("{} must be a boolean (true/false), not '{}'", envkey, value));
}

Millis Configuration::millis_env(const std::string &envkey, const Millis default_value) {
    return Millis(int_env(envkey, static_cast<int>(default_value.count())));
}
