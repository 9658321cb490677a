/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "DuelSystem.hpp"

#include <cstdint>
#include <limits>
#include <magic_enum.hpp>
#include <range/v3/algorithm/any_of.hpp>

namespace Duels {

using Events::ChallengeOutcome;

DuelSystem::DuelSystem(World &world, TimerQueue &timers, GoldLedger &ledger, ArenaServices &services,
                       EventSink &events, Logger &logger, DuelSettings settings)
    : world_(world), timers_(timers), ledger_(ledger), services_(services), events_(events), logger_(logger),
      settings_(std::move(settings)) {}

DuelSystem::~DuelSystem() {
    for (auto &[target, challenge] : challenges_)
        challenge.expiry.cancel();
    for (auto &[id, slot] : arenas_) {
        if (slot.context) {
            slot.context->phase_timer.cancel();
            slot.context->match_timer.cancel();
        }
    }
}

void DuelSystem::add_arena(Arena arena, std::unique_ptr<DuelRuleset> ruleset) {
    const auto id = arena.id;
    if (arenas_.contains(id)) {
        logger_.bug("Arena {} registered twice", id);
        return;
    }
    logger_.log_string("Arena {} '{}' hosts {} duels with the {} ruleset", id, arena.name,
                       magic_enum::enum_name(arena.type), ruleset->name());
    arenas_.emplace(id, ArenaSlot{std::move(arena), std::move(ruleset), nullptr});
}

bool DuelSystem::can_duel(const ActorId actor) {
    const auto *ch = world_.find_actor(actor);
    return ch && !ch->is_deleted() && ch->is_alive() && ch->is_player();
}

std::optional<std::string> DuelSystem::validate_duellists(const ActorId initiator, const ActorId target) {
    if (initiator == target)
        return "You cannot duel yourself.";
    if (!can_duel(initiator))
        return "You are in no state to duel.";
    if (!can_duel(target))
        return "They are in no state to duel.";
    if (duel_of(initiator))
        return "You are already in a duel.";
    if (duel_of(target))
        return "They are already in a duel.";
    if (outgoing_.contains(initiator))
        return "You have already issued a challenge.";
    if (challenges_.contains(initiator))
        return "You must first answer the challenge you have been given.";
    if (challenges_.contains(target) || outgoing_.contains(target))
        return "They are already considering a challenge.";
    return std::nullopt;
}

std::optional<std::string> DuelSystem::issue_challenge(const ActorId initiator, const ActorId target,
                                                       const ArenaId arena, const int wager, const bool is_loot) {
    if (auto error = validate_duellists(initiator, target))
        return error;
    auto it = arenas_.find(arena);
    if (it == arenas_.end())
        return "There is no such arena.";
    const auto &slot = it->second;
    if (slot.context)
        return "That arena is already in use.";
    if (is_loot != is_loot_duel(slot.arena.type))
        return is_loot ? "That arena does not host loot duels." : "That arena only hosts loot duels.";
    const auto stake = is_loot ? 0 : wager;
    if (stake < 0)
        return "Wagers cannot be negative.";
    if (stake > std::numeric_limits<int>::max() / static_cast<int>(capacity(slot.arena.type)))
        return "That wager is too large.";
    if (stake > 0 && !ledger_.debit(initiator, stake))
        return "You cannot afford that wager.";

    const auto serial = next_serial_++;
    const auto now = world_.current_time();
    auto &challenge = challenges_[target];
    challenge = PendingChallenge{.initiator = initiator,
                                 .target = target,
                                 .arena = arena,
                                 .wager = stake,
                                 .is_loot = is_loot,
                                 .created_at = now,
                                 .serial = serial,
                                 .expiry = {}};
    challenge.expiry = timers_.schedule(now + settings_.challenge_timeout,
                                        [this, target, serial] { expire_challenge(target, serial); });
    outgoing_[initiator] = target;
    logger_.log_new(LogChannel::Debug, "{} challenged {} in arena {} for {} gold", initiator, target, arena, stake);
    events_.publish(Events::ChallengeIssued{initiator, target, arena, stake, is_loot});
    return std::nullopt;
}

void DuelSystem::withdraw_challenge(const ActorId target, const ChallengeOutcome outcome) {
    auto it = challenges_.find(target);
    if (it == challenges_.end())
        return;
    auto challenge = std::move(it->second);
    challenges_.erase(it);
    outgoing_.erase(challenge.initiator);
    challenge.expiry.cancel();
    if (challenge.wager > 0)
        ledger_.refund(challenge.initiator, challenge.wager);
    logger_.log_new(LogChannel::Debug, "Challenge from {} to {} closed: {}", challenge.initiator, target,
                    magic_enum::enum_name(outcome));
    events_.publish(Events::ChallengeClosed{challenge.initiator, target, outcome});
}

void DuelSystem::expire_challenge(const ActorId target, const uint64_t serial) {
    if (auto it = challenges_.find(target); it != challenges_.end() && it->second.serial == serial)
        withdraw_challenge(target, ChallengeOutcome::Expired);
}

void DuelSystem::decline_challenge(const ActorId target) { withdraw_challenge(target, ChallengeOutcome::Declined); }

std::optional<std::string> DuelSystem::accept_challenge(const ActorId target) {
    auto it = challenges_.find(target);
    if (it == challenges_.end())
        return "You have not been challenged.";
    auto challenge = std::move(it->second);
    challenges_.erase(it);
    outgoing_.erase(challenge.initiator);
    challenge.expiry.cancel();

    auto refuse = [&](const ChallengeOutcome outcome, std::string message) -> std::optional<std::string> {
        if (challenge.wager > 0)
            ledger_.refund(challenge.initiator, challenge.wager);
        events_.publish(Events::ChallengeClosed{challenge.initiator, target, outcome});
        return message;
    };
    if (!can_duel(challenge.initiator) || duel_of(challenge.initiator))
        return refuse(ChallengeOutcome::Withdrawn, "Your challenger is no longer available.");
    if (!can_duel(target))
        return refuse(ChallengeOutcome::Declined, "You are in no state to duel.");
    auto slot_it = arenas_.find(challenge.arena);
    if (slot_it == arenas_.end() || slot_it->second.context)
        return refuse(ChallengeOutcome::Withdrawn, "The arena is no longer available.");
    if (challenge.wager > 0 && !ledger_.debit(target, challenge.wager))
        return refuse(ChallengeOutcome::Declined, "You cannot afford the wager.");

    auto &slot = slot_it->second;
    slot.context = std::make_unique<DuelContext>(slot.arena, *slot.ruleset, challenge.wager, next_serial_++);
    auto &context = *slot.context;
    context.add(challenge.initiator, challenge.wager);
    context.add(target, challenge.wager);
    services_.lock_region(slot.arena);
    events_.publish(Events::ChallengeClosed{challenge.initiator, target, ChallengeOutcome::Accepted});
    events_.publish(Events::DuelStateChanged{slot.arena.id, DuelState::Pending, DuelState::Waiting});
    if (context.is_full())
        start_countdown(context);
    return std::nullopt;
}

std::optional<std::string> DuelSystem::join_duel(const ArenaId arena, const ActorId actor) {
    auto *context = active_duel(arena);
    if (!context)
        return "There is no duel to join there.";
    if (context->state() != DuelState::Waiting || context->is_full())
        return "That duel is not taking any more duellists.";
    if (!can_duel(actor))
        return "You are in no state to duel.";
    if (duel_of(actor))
        return "You are already in a duel.";
    if (challenges_.contains(actor) || outgoing_.contains(actor))
        return "You must resolve your pending challenge first.";
    if (context->wager() > 0 && !ledger_.debit(actor, context->wager()))
        return "You cannot afford the wager.";
    context->add(actor, context->wager());
    if (context->is_full())
        start_countdown(*context);
    return std::nullopt;
}

void DuelSystem::change_state(DuelContext &context, const DuelState state) {
    const auto from = context.state();
    if (from == state)
        return;
    context.set_state(state);
    logger_.log_new(LogChannel::Debug, "Duel in arena {}: {} -> {}", context.arena().id, magic_enum::enum_name(from),
                    magic_enum::enum_name(state));
    events_.publish(Events::DuelStateChanged{context.arena().id, from, state});
}

DuelContext *DuelSystem::live_context(const ArenaId arena, const uint64_t serial) {
    auto *context = active_duel(arena);
    return context && context->serial() == serial ? context : nullptr;
}

void DuelSystem::start_countdown(DuelContext &context) {
    change_state(context, DuelState::Countdown);
    context.countdown_remaining = static_cast<int>(settings_.countdown.count());
    events_.publish(Events::DuelCountdown{context.arena().id, context.countdown_remaining});
    context.phase_timer = timers_.schedule(
        world_.current_time() + Seconds(1),
        [this, arena = context.arena().id, serial = context.serial()] { countdown_tick(arena, serial); });
}

void DuelSystem::countdown_tick(const ArenaId arena, const uint64_t serial) {
    auto *context = live_context(arena, serial);
    if (!context || context->state() != DuelState::Countdown)
        return;
    if (--context->countdown_remaining <= 0) {
        begin_duel(*context);
        return;
    }
    events_.publish(Events::DuelCountdown{arena, context->countdown_remaining});
    context->phase_timer = timers_.schedule(world_.current_time() + Seconds(1),
                                            [this, arena, serial] { countdown_tick(arena, serial); });
}

void DuelSystem::begin_duel(DuelContext &context) {
    if (context.state() != DuelState::Countdown)
        return;
    context.phase_timer.cancel();
    const auto now = world_.current_time();
    const auto &participants = context.participants();
    for (size_t spawn = 0; spawn < participants.size(); ++spawn) {
        services_.move_to_arena(participants[spawn].actor, context.arena(), spawn);
        services_.restore(participants[spawn].actor);
    }
    context.mark_started(now);
    change_state(context, DuelState::InProgress);
    context.ruleset().on_begin(context);
    context.match_timer = timers_.schedule(
        now + settings_.match_timeout, [this, arena = context.arena().id, serial = context.serial()] {
            if (auto *timed_out = live_context(arena, serial); timed_out && timed_out->state() == DuelState::InProgress) {
                logger_.log_string("Duel in arena {} ran out of time and is a draw", arena);
                end_duel(*timed_out, std::nullopt);
            }
        });
}

void DuelSystem::on_death(const ActorId victim, const std::optional<ActorId> killer) {
    auto *context = duel_of(victim);
    if (!context || context->state() != DuelState::InProgress)
        return;
    auto *participant = context->find(victim);
    if (!participant || participant->eliminated)
        return;
    ++participant->deaths;
    participant->eliminated = true;
    if (killer && *killer != victim) {
        if (auto *killer_participant = context->find(*killer)) {
            ++killer_participant->kills;
            services_.clear_scoring(victim, *killer);
        }
    }
    const auto verdict = context->evaluate(world_);
    switch (verdict.kind) {
    case Verdict::Kind::Winner: end_duel(*context, verdict.winner); break;
    case Verdict::Kind::Draw: end_duel(*context, std::nullopt); break;
    case Verdict::Kind::Undecided: break;
    }
}

void DuelSystem::on_disconnect(const ActorId actor) {
    withdraw_challenge(actor, ChallengeOutcome::Withdrawn);
    if (auto out = outgoing_.find(actor); out != outgoing_.end())
        withdraw_challenge(out->second, ChallengeOutcome::Withdrawn);
    auto *context = duel_of(actor);
    if (!context)
        return;
    switch (context->state()) {
    case DuelState::Waiting:
    case DuelState::Countdown: {
        const auto stake = context->find(actor)->stake;
        context->remove(actor);
        if (stake > 0)
            ledger_.refund(actor, stake);
        if (context->participants().size() < 2) {
            cancel_duel(*context, "too few duellists remain");
            return;
        }
        if (context->state() == DuelState::Countdown && !context->is_full()) {
            context->phase_timer.cancel();
            change_state(*context, DuelState::Waiting);
        }
        return;
    }
    case DuelState::InProgress:
        // Leaving mid fight forfeits.
        on_death(actor, std::nullopt);
        return;
    default: return;
    }
}

void DuelSystem::end_duel(DuelContext &context, const std::optional<ActorId> winner) {
    if (context.is_over())
        return;
    if (context.state() != DuelState::InProgress) {
        cancel_duel(context, "ended before it began");
        return;
    }
    context.phase_timer.cancel();
    context.match_timer.cancel();
    change_state(context, DuelState::Ending);

    std::vector<ActorId> winners;
    std::vector<ActorId> losers;
    const auto *winning = winner ? context.find(*winner) : nullptr;
    for (const auto &participant : context.participants()) {
        const auto won = winning
                         && (is_team_duel(context.type()) ? participant.team == winning->team
                                                          : participant.actor == winning->actor);
        (won ? winners : losers).push_back(participant.actor);
    }
    settle(context, winners);

    const auto now = world_.current_time();
    const auto started = context.started_at().value_or(now);
    context.result = DuelResult{.arena = context.arena().id,
                                .type = context.type(),
                                .winners = winners,
                                .losers = winning ? losers : std::vector<ActorId>{},
                                .participants = context.participants(),
                                .duration = std::chrono::duration_cast<Millis>(now - started),
                                .pot = context.pot(),
                                .ended_at = now};
    logger_.log_string("Duel in arena {} over after {}s: {}", context.arena().id,
                       std::chrono::duration_cast<Seconds>(now - started).count(),
                       winning ? fmt::format("{} winner(s)", winners.size()) : "draw");
    events_.publish(Events::DuelEnded{*context.result});
    context.ruleset().on_complete(context);

    const auto loot_phase = context.is_loot() && winning;
    if (loot_phase)
        change_state(context, DuelState::LootPhase);
    context.phase_timer =
        timers_.schedule(now + (loot_phase ? settings_.loot_phase : settings_.cleanup_delay),
                         [this, arena = context.arena().id, serial = context.serial()] { cleanup(arena, serial); });
}

void DuelSystem::settle(DuelContext &context, const std::vector<ActorId> &winners) {
    if (context.is_loot())
        return;
    const auto pot = context.pot();
    if (pot == 0)
        return;
    if (winners.empty()) {
        for (const auto &participant : context.participants())
            if (participant.stake > 0)
                ledger_.refund(participant.actor, participant.stake);
        return;
    }
    // Wagers are bounded so the pot fits an int; pot * percent need not.
    const auto share = static_cast<int>(int64_t{pot} * settings_.payout_percent / 100
                                        / static_cast<int64_t>(winners.size()));
    for (const auto winner : winners)
        ledger_.credit(winner, share);
}

void DuelSystem::cleanup(const ArenaId arena, const uint64_t serial) {
    auto *context = live_context(arena, serial);
    if (!context)
        return;
    const auto participants = context->participants();
    for (const auto &participant : participants) {
        for (const auto &other : participants)
            if (other.actor != participant.actor)
                services_.clear_scoring(participant.actor, other.actor);
        if (world_.find_actor(participant.actor)) {
            services_.restore(participant.actor);
            services_.return_from_arena(participant.actor, context->arena());
        }
    }
    archive(*context, DuelState::Completed);
}

void DuelSystem::cancel_duel(DuelContext &context, std::string_view reason) {
    context.phase_timer.cancel();
    context.match_timer.cancel();
    for (const auto &participant : context.participants())
        if (participant.stake > 0)
            ledger_.refund(participant.actor, participant.stake);
    logger_.log_string("Duel in arena {} cancelled: {}", context.arena().id, reason);
    archive(context, DuelState::Cancelled);
}

void DuelSystem::archive(DuelContext &context, const DuelState final_state) {
    const auto arena = context.arena().id;
    services_.release_region(context.arena());
    change_state(context, final_state);
    if (context.result) {
        history_.push_back(*context.result);
        while (history_.size() > settings_.history_limit)
            history_.pop_front();
    }
    arenas_.at(arena).context.reset();
}

const PendingChallenge *DuelSystem::pending_challenge(const ActorId target) const {
    if (auto it = challenges_.find(target); it != challenges_.end())
        return &it->second;
    return nullptr;
}

DuelContext *DuelSystem::active_duel(const ArenaId arena) {
    if (auto it = arenas_.find(arena); it != arenas_.end())
        return it->second.context.get();
    return nullptr;
}

DuelContext *DuelSystem::duel_of(const ActorId actor) {
    for (auto &[id, slot] : arenas_)
        if (slot.context && slot.context->find(actor))
            return slot.context.get();
    return nullptr;
}

}
