/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "DuelRuleset.hpp"
#include "CombatPulse.hpp"
#include "DuelContext.hpp"

namespace Duels {

SphereRuleset::SphereRuleset(CombatPulse &pulse) : pulse_(pulse) {}

void SphereRuleset::on_begin(const DuelContext &context) {
    for (const auto &participant : context.participants())
        pulse_.register_combatant(participant.actor);
}

void SphereRuleset::on_complete(const DuelContext &context) {
    for (const auto &participant : context.participants())
        pulse_.unregister_combatant(participant.actor);
}

}
