/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "CombatantTimingState.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

CombatantTimingState::CombatantTimingState(const ActorId actor, const CombatPolicy &policy, Logger &logger,
                                           EventSink &events)
    : actor_(actor), policy_(policy), logger_(logger), events_(events) {}

CombatantTimingState::~CombatantTimingState() {
    if (cast_)
        cast_->delay_timer.cancel();
}

Time &CombatantTimingState::slot(const ActionKind kind) noexcept {
    return next_ready_[policy_.independent_timers ? magic_enum::enum_integer(kind) : 0];
}

Time CombatantTimingState::next_ready(const ActionKind kind) const noexcept {
    return next_ready_[policy_.independent_timers ? magic_enum::enum_integer(kind) : 0];
}

bool CombatantTimingState::is_ready(const ActionKind kind, const Time now) const noexcept {
    return next_ready(kind) <= now;
}

void CombatantTimingState::set_next_ready(const ActionKind kind, const Time now, const Millis delay) {
    slot(kind) = now + delay;
    logger_.log_new(LogChannel::TimerChanges, "{} - next {} in {}ms", actor_, magic_enum::enum_name(kind),
                    delay.count());
}

std::optional<Time> CombatantTimingState::swing_hit_time() const noexcept {
    if (!swing_pending_)
        return std::nullopt;
    return swing_hit_time_;
}

std::optional<Rejection> CombatantTimingState::blocked(const ActionKind kind, std::string reason) const {
    logger_.log_new(LogChannel::Debug, "{} - {} blocked: {}", actor_, magic_enum::enum_name(kind), reason);
    return Rejection{ActionError::ActionBlocked, std::move(reason)};
}

std::optional<Rejection> CombatantTimingState::swing_blocked_by_cast() const {
    if (!cast_ || is_terminal(cast_->status))
        return std::nullopt;
    const auto in_delay = cast_->status == CastStatus::Delaying || cast_->status == CastStatus::Resolving;
    if (!in_delay && policy_.disable_swing_during_cast)
        return blocked(ActionKind::Swing, "You cannot swing while casting.");
    if (in_delay && policy_.disable_swing_during_cast_delay)
        return blocked(ActionKind::Swing, "You cannot swing until your spell takes effect.");
    return std::nullopt;
}

std::optional<Rejection> CombatantTimingState::begin_swing(const TimingSnapshot &timing, const Time now) {
    if (swing_pending_)
        return blocked(ActionKind::Swing, "You are already swinging.");
    if (!is_ready(ActionKind::Swing, now))
        return blocked(ActionKind::Swing, "You are not ready to swing again.");
    if (auto rejection = swing_blocked_by_cast())
        return rejection;
    if (policy_.swing_cancels_spell)
        cancel(ActionKind::Cast, "interrupted by a weapon swing");
    if (policy_.action_cancels_bandage)
        cancel(ActionKind::Bandage, "interrupted by a weapon swing");

    swing_pending_ = true;
    swing_hit_time_ = now + Millis(timing.animation_hit_offset_ms);
    set_next_ready(ActionKind::Swing, now, Millis(timing.attack_interval_ms));
    last_action_time_ = now;
    logger_.log_new(LogChannel::Debug, "{} - swing begun, interval {}ms", actor_, timing.attack_interval_ms);
    return std::nullopt;
}

std::optional<Rejection> CombatantTimingState::can_begin_cast(const Time now) const {
    if (!is_ready(ActionKind::Cast, now))
        return blocked(ActionKind::Cast, "You have not yet recovered from your last spell.");
    if (swing_pending_ && policy_.swing_blocks_cast)
        return blocked(ActionKind::Cast, "You cannot cast in the middle of a swing.");
    return std::nullopt;
}

std::optional<Rejection> CombatantTimingState::begin_cast(Spell &spell, const Time now, const bool from_scroll) {
    if (cast_)
        return blocked(ActionKind::Cast, "You are already casting a spell.");
    if (auto rejection = can_begin_cast(now))
        return rejection;
    if (policy_.spell_cancels_swing)
        cancel(ActionKind::Swing, "interrupted by spellcasting");
    if (policy_.action_cancels_bandage)
        cancel(ActionKind::Bandage, "interrupted by spellcasting");

    cast_ = std::make_unique<CastDescriptor>(
        CastDescriptor{.caster = actor_, .spell = spell, .serial = next_cast_serial_++, .from_scroll = from_scroll,
                       .started_at = now});
    last_action_time_ = now;
    logger_.log_new(LogChannel::Debug, "{} - cast begun: {}", actor_, spell.name());
    return std::nullopt;
}

std::optional<Rejection> CombatantTimingState::begin_bandage(const Time now, const Millis duration) {
    if (bandaging_)
        return blocked(ActionKind::Bandage, "You are already applying a bandage.");
    if (!is_ready(ActionKind::Bandage, now))
        return blocked(ActionKind::Bandage, "You must wait before applying another bandage.");
    if (policy_.bandage_cancels_actions) {
        cancel(ActionKind::Swing, "interrupted by bandaging");
        cancel(ActionKind::Cast, "interrupted by bandaging");
    }
    bandaging_ = true;
    set_next_ready(ActionKind::Bandage, now, duration);
    last_action_time_ = now;
    return std::nullopt;
}

std::optional<Rejection> CombatantTimingState::begin_wand(const Time now, const Millis recovery) {
    if (!is_ready(ActionKind::Wand, now))
        return blocked(ActionKind::Wand, "You must wait before using a wand again.");
    if (policy_.wand_cancels_actions) {
        cancel(ActionKind::Swing, "interrupted by wand use");
        cancel(ActionKind::Cast, "interrupted by wand use");
    }
    set_next_ready(ActionKind::Wand, now, recovery);
    last_action_time_ = now;
    return std::nullopt;
}

bool CombatantTimingState::cancel(const ActionKind kind, std::string_view reason) {
    switch (kind) {
    case ActionKind::Swing:
        if (!swing_pending_)
            return false;
        swing_pending_ = false;
        break;
    case ActionKind::Cast: {
        if (!cast_ || is_terminal(cast_->status))
            return false;
        // Resources already committed stay spent.
        auto cast = std::move(cast_);
        cast->delay_timer.cancel();
        cast->status = CastStatus::Interrupted;
        logger_.log_new(LogChannel::Cancellations, "{} - spell cast cancelled: {} ({})", actor_, reason,
                        cast->spell.name());
        events_.publish(Events::CastInterrupted{actor_, std::string(cast->spell.name()), std::string(reason)});
        return true;
    }
    case ActionKind::Bandage:
        if (!bandaging_)
            return false;
        bandaging_ = false;
        break;
    case ActionKind::Wand:
        // Wand use completes instantly; only its recovery remains.
        return false;
    }
    logger_.log_new(LogChannel::Cancellations, "{} - {} cancelled: {}", actor_, magic_enum::enum_name(kind), reason);
    events_.publish(Events::ActionCancelled{actor_, kind, std::string(reason)});
    return true;
}

void CombatantTimingState::finish_cast(const Time now) {
    if (!cast_)
        return;
    const auto completed = cast_->status == CastStatus::Applied;
    cast_->delay_timer.cancel();
    cast_.reset();
    if (completed && !policy_.remove_post_cast_recovery)
        set_next_ready(ActionKind::Cast, now, policy_.post_cast_recovery);
}

CombatStates::CombatStates(CombatPolicy policy, Logger &logger, EventSink &events)
    : policy_(std::move(policy)), logger_(logger), events_(events) {}

CombatantTimingState &CombatStates::get_or_create(const ActorId actor) {
    auto &state = states_[actor];
    if (!state)
        state = std::make_unique<CombatantTimingState>(actor, policy_, logger_, events_);
    return *state;
}

CombatantTimingState *CombatStates::find(const ActorId actor) {
    if (auto it = states_.find(actor); it != states_.end())
        return it->second.get();
    return nullptr;
}

void CombatStates::remove(const ActorId actor) {
    if (auto it = states_.find(actor); it != states_.end()) {
        auto state = std::move(it->second);
        states_.erase(it);
        state->cancel(ActionKind::Cast, "caster removed");
    }
}
