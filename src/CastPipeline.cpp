/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "CastPipeline.hpp"

#include <algorithm>

namespace {

bool can_act(const Actor *actor) { return actor && !actor->is_deleted() && actor->is_alive(); }

}

CastPipeline::CastPipeline(World &world, CombatStates &states, TimerQueue &timers,
                           const SpellTimingTable &spell_timing, EventSink &events, Logger &logger)
    : world_(world), states_(states), timers_(timers), spell_timing_(spell_timing), events_(events),
      logger_(logger) {}

std::optional<Rejection> CastPipeline::begin_cast(const ActorId caster, Spell &spell, const bool from_scroll) {
    if (!can_act(world_.find_actor(caster))) {
        return Rejection{ActionError::ActionBlocked, "You cannot cast right now."};
    }
    const auto now = world_.current_time();
    auto &state = states_.get_or_create(caster);
    auto rejection = state.can_begin_cast(now);
    if (!rejection) {
        // Casts are strictly sequential: the current one is given up only once the new one is allowed.
        if (auto *current = state.active_cast(); current && !is_terminal(current->status)) {
            logger_.log_new(LogChannel::Cancellations, "{} - {} replaced by {}", caster, current->spell.name(),
                            spell.name());
            state.cancel(ActionKind::Cast, "Your concentration shifts to another spell.");
        }
        rejection = state.begin_cast(spell, now, from_scroll);
    }
    if (rejection)
        events_.publish(Events::ActionRejected{caster, ActionKind::Cast, rejection->error, rejection->reason});
    return rejection;
}

void CastPipeline::confirm_target(const ActorId caster, const ActorId target) {
    auto *state = states_.find(caster);
    if (!state)
        return;
    auto *cast = state->active_cast();
    if (!cast || cast->status != CastStatus::AwaitingTarget)
        return;
    auto *actor = world_.find_actor(caster);
    if (!can_act(actor)) {
        state->cancel(ActionKind::Cast, "caster can no longer cast");
        return;
    }
    cast->target = target;
    cast->status = CastStatus::ResourceCommit;
    commit(*state, *cast, *actor, world_.current_time());
}

void CastPipeline::commit(CombatantTimingState &state, CastDescriptor &cast, Actor &caster, const Time now) {
    const auto cost = cast.spell.mana_cost();
    if (caster.mana() < cost) {
        fizzle(state, ActionError::InsufficientResources, "You lack the mana for that spell.", now);
        return;
    }
    if (!cast.spell.consume_reagents(caster)) {
        fizzle(state, ActionError::InsufficientResources, "You lack the reagents for that spell.", now);
        return;
    }
    const auto upfront = cost * states_.policy().partial_mana_percent / 100;
    caster.set_mana(caster.mana() - upfront);
    cast.mana_outstanding = cost - upfront;
    cast.resources_committed = true;

    const auto delay = cast_delay(cast, caster);
    cast.status = CastStatus::Delaying;
    cast.effect_time = now + delay;
    events_.publish(Events::CastDelayStarted{cast.caster, std::string(cast.spell.name()), delay});
    if (delay == Millis::zero()) {
        resolve(cast.caster, cast.serial);
        return;
    }
    cast.delay_timer = timers_.schedule(
        *cast.effect_time, [this, caster_id = cast.caster, serial = cast.serial] { resolve(caster_id, serial); });
}

Millis CastPipeline::cast_delay(const CastDescriptor &cast, const Actor &caster) const {
    const auto &policy = states_.policy();
    const auto delay = spell_timing_.cast_delay(cast.spell.name(), caster.skill(MagerySkill), cast.from_scroll);
    return std::clamp(delay, policy.min_cast_delay, policy.max_cast_delay);
}

void CastPipeline::resolve(const ActorId caster, const uint64_t serial) {
    auto *state = states_.find(caster);
    if (!state)
        return;
    auto *cast = state->active_cast();
    if (!cast || cast->serial != serial || cast->status != CastStatus::Delaying)
        return;
    cast->status = CastStatus::Resolving;
    const auto now = world_.current_time();

    auto *actor = world_.find_actor(caster);
    if (!can_act(actor)) {
        state->cancel(ActionKind::Cast, "caster can no longer cast");
        return;
    }
    auto *target = cast->target ? world_.find_actor(*cast->target) : nullptr;
    if (!can_act(target)) {
        state->cancel(ActionKind::Cast, "target is no longer valid");
        return;
    }
    auto &spell = cast->spell;
    if (spell.needs_line_of_sight() && !actor->in_line_of_sight(*target)) {
        state->cancel(ActionKind::Cast, "target is out of sight");
        return;
    }
    if (cast->mana_outstanding > 0) {
        if (actor->mana() < cast->mana_outstanding) {
            fizzle(*state, ActionError::InsufficientResources, "You lack the mana to complete that spell.", now);
            return;
        }
        actor->set_mana(actor->mana() - cast->mana_outstanding);
    }

    const std::string spell_name(spell.name());
    const auto target_id = target->id();
    auto *recipient = target;
    if (spell.has_reflection(*target)) {
        recipient = actor;
        events_.publish(Events::SpellReflected{caster, target_id, spell_name});
    }
    const auto recipient_id = recipient->id();
    cast->status = CastStatus::Applied;
    state->finish_cast(now);
    spell.apply_effect(*actor, *recipient);
    events_.publish(Events::CastApplied{caster, recipient_id, spell_name});
}

void CastPipeline::fizzle(CombatantTimingState &state, const ActionError error, std::string reason,
                          const Time now) {
    auto *cast = state.active_cast();
    if (!cast || is_terminal(cast->status))
        return;
    cast->delay_timer.cancel();
    cast->status = CastStatus::Fizzled;
    logger_.log_new(LogChannel::Debug, "{} - {} fizzled: {}", cast->caster, cast->spell.name(), reason);
    events_.publish(Events::CastFizzled{cast->caster, std::string(cast->spell.name()), error, std::move(reason)});
    state.finish_cast(now);
}

void CastPipeline::abort(const ActorId caster, std::string_view reason) {
    if (auto *state = states_.find(caster))
        state->cancel(ActionKind::Cast, reason);
}

void CastPipeline::on_caster_damaged(const ActorId caster) {
    if (!states_.policy().damage_interrupts_cast)
        return;
    auto *state = states_.find(caster);
    if (!state)
        return;
    if (const auto *cast = state->active_cast(); cast && cast->status == CastStatus::Delaying)
        state->cancel(ActionKind::Cast, "interrupted by damage");
}

std::optional<CastStatus> CastPipeline::status(const ActorId caster) {
    if (auto *state = states_.find(caster))
        if (const auto *cast = state->active_cast())
            return cast->status;
    return std::nullopt;
}
