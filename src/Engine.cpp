/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Engine.hpp"

#include <algorithm>
#include <magic_enum.hpp>
#include <thread>

namespace {

void configure_channels(Logger &logger, const Configuration &config) {
    logger.enable(LogChannel::Debug, config.debug_logging());
    logger.enable(LogChannel::Cancellations, config.log_cancellations());
    logger.enable(LogChannel::TimerChanges, config.log_timer_changes());
}

}

Engine::Engine(const Configuration &config, World &world, AttackResolver &resolver, Duels::GoldLedger &ledger,
               Duels::ArenaServices &arena_services, EventSink &events, Logger &logger)
    : world_(world), events_(events), logger_(logger), timers_(logger),
      states_(config.combat_policy(), logger, events),
      timing_(make_timing_provider(config.timing_provider(), config.combat_policy())),
      pulse_(world, timers_, states_, *timing_, resolver, config.pulse_settings(), events, logger),
      casts_(world, states_, timers_, spell_timing_, events, logger),
      duels_(world, timers_, ledger, arena_services, events, logger) {
    configure_channels(logger_, config);
    logger_.log_string("Combat engine using {} timings, {} timers", timing_->name(),
                       config.combat_policy().independent_timers ? "independent" : "shared");
}

Engine::~Engine() {
    pulse_.stop();
    timers_.clear();
}

void Engine::start() { pulse_.start(); }

void Engine::stop() { pulse_.stop(); }

void Engine::run_for(const Millis duration) {
    const auto deadline = world_.current_time() + duration;
    while (is_running()) {
        if (world_.current_time() >= deadline)
            break;
        const auto wake = std::min(timers_.next_due().value_or(deadline), deadline);
        std::this_thread::sleep_until(wake);
        poll();
    }
}

size_t Engine::poll() { return timers_.run_due(world_.current_time()); }

std::optional<Rejection> Engine::published(const ActorId actor, const ActionKind kind,
                                           std::optional<Rejection> rejection) {
    if (rejection) {
        logger_.log_new(LogChannel::Debug, "{} {} refused: {}", actor, magic_enum::enum_name(kind),
                        rejection->reason);
        events_.publish(Events::ActionRejected{actor, kind, rejection->error, rejection->reason});
    }
    return rejection;
}

std::optional<Rejection> Engine::request_bandage(const ActorId actor, const Millis duration) {
    const auto *ch = world_.find_actor(actor);
    if (!ch || ch->is_deleted() || !ch->is_alive())
        return published(actor, ActionKind::Bandage,
                         Rejection{ActionError::ActionBlocked, "You cannot apply bandages right now."});
    const auto now = world_.current_time();
    if (auto rejection = states_.get_or_create(actor).begin_bandage(now, duration))
        return published(actor, ActionKind::Bandage, std::move(rejection));
    auto &token = bandages_[actor];
    token.cancel();
    token = timers_.schedule(now + duration, [this, actor] {
        bandages_.erase(actor);
        if (auto *state = states_.find(actor); state && state->is_bandaging()) {
            state->end_bandage();
            logger_.log_new(LogChannel::Debug, "{} - bandage finished", actor);
        }
    });
    return std::nullopt;
}

std::optional<Rejection> Engine::request_wand(const ActorId actor, const Millis recovery) {
    const auto *ch = world_.find_actor(actor);
    if (!ch || ch->is_deleted() || !ch->is_alive())
        return published(actor, ActionKind::Wand, Rejection{ActionError::ActionBlocked, "You cannot use that now."});
    return published(actor, ActionKind::Wand, states_.get_or_create(actor).begin_wand(world_.current_time(), recovery));
}

bool Engine::cancel(const ActorId actor, const ActionKind kind, std::string_view reason) {
    auto *state = states_.find(actor);
    return state && state->cancel(kind, reason);
}

void Engine::remove_actor(const ActorId actor) {
    if (auto it = bandages_.find(actor); it != bandages_.end()) {
        it->second.cancel();
        bandages_.erase(it);
    }
    duels_.on_disconnect(actor);
    casts_.abort(actor, "caster has left");
    pulse_.unregister_combatant(actor);
    states_.remove(actor);
}
