/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "DuelContext.hpp"

#include <array>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/remove_if.hpp>
#include <range/v3/numeric/accumulate.hpp>

namespace Duels {

DuelContext::DuelContext(const Arena &arena, DuelRuleset &ruleset, const int wager, const uint64_t serial)
    : arena_(arena), ruleset_(ruleset), wager_(wager), serial_(serial) {}

bool DuelContext::is_over() const noexcept {
    return state_ == DuelState::Ending || state_ == DuelState::LootPhase || state_ == DuelState::Completed
           || state_ == DuelState::Cancelled;
}

DuelParticipant *DuelContext::find(const ActorId actor) {
    auto it = ranges::find_if(participants_, [actor](const auto &p) { return p.actor == actor; });
    return it != participants_.end() ? &*it : nullptr;
}

const DuelParticipant *DuelContext::find(const ActorId actor) const {
    auto it = ranges::find_if(participants_, [actor](const auto &p) { return p.actor == actor; });
    return it != participants_.end() ? &*it : nullptr;
}

DuelParticipant &DuelContext::add(const ActorId actor, const int stake) {
    const auto team = static_cast<int>(participants_.size() % 2);
    return participants_.emplace_back(DuelParticipant{.actor = actor, .team = team, .stake = stake});
}

void DuelContext::remove(const ActorId actor) {
    participants_.erase(ranges::remove_if(participants_, [actor](const auto &p) { return p.actor == actor; }),
                        participants_.end());
    for (size_t index = 0; index < participants_.size(); ++index)
        participants_[index].team = static_cast<int>(index % 2);
}

int DuelContext::pot() const noexcept {
    return ranges::accumulate(participants_, 0, [](int total, const auto &p) { return total + p.stake; });
}

Verdict DuelContext::evaluate(World &world) const {
    std::array<int, 2> alive_per_team{};
    std::optional<ActorId> last_alive;
    std::array<std::optional<ActorId>, 2> survivor_per_team;
    for (const auto &participant : participants_) {
        if (participant.eliminated)
            continue;
        const auto *actor = world.find_actor(participant.actor);
        if (!actor || actor->is_deleted() || !actor->is_alive())
            continue;
        ++alive_per_team[participant.team];
        survivor_per_team[participant.team] = participant.actor;
        last_alive = participant.actor;
    }
    const auto alive = alive_per_team[0] + alive_per_team[1];
    if (alive == 1)
        return {Verdict::Kind::Winner, last_alive};
    if (alive == 0)
        return {Verdict::Kind::Draw, std::nullopt};
    if (is_team_duel(arena_.type)) {
        if (alive_per_team[0] == 0)
            return {Verdict::Kind::Winner, survivor_per_team[1]};
        if (alive_per_team[1] == 0)
            return {Verdict::Kind::Winner, survivor_per_team[0]};
    }
    return {Verdict::Kind::Undecided, std::nullopt};
}

}
