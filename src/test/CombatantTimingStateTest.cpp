/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "CombatantTimingState.hpp"
#include "CatchFormatters.hpp"
#include "FakeWorld.hpp"
#include "MemFile.hpp"

#include <catch2/catch.hpp>

namespace {

const Time Start = Clock::from_time_t(1'700'000'000);
const TimingSnapshot Swing{.attack_interval_ms = 2000, .animation_hit_offset_ms = 300, .animation_duration_ms = 600};

struct Fixture {
    test::MemFile log_file;
    Logger logger{log_file.file()};
    test::RecordingSink events;
    test::MockSpell spell;
    std::unique_ptr<trompeloeil::expectation> spell_name = NAMED_ALLOW_CALL(spell, name()).RETURN("explosion");
};

}

TEST_CASE("swing readiness") {
    Fixture f;
    CombatPolicy policy;
    CombatantTimingState state(1, policy, f.logger, f.events);

    SECTION("ready before any swing") { CHECK(state.is_ready(ActionKind::Swing, Start)); }
    SECTION("not ready immediately after a swing") {
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(!state.is_ready(ActionKind::Swing, Start));
        CHECK(!state.is_ready(ActionKind::Swing, Start + Millis(1999)));
    }
    SECTION("ready once the interval has passed") {
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(state.is_ready(ActionKind::Swing, Start + Millis(2000)));
        CHECK(state.next_ready(ActionKind::Swing) == Start + Millis(2000));
    }
    SECTION("the swing is pending until it lands") {
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(state.swing_pending());
        CHECK(state.swing_hit_time() == Start + Millis(300));
        state.complete_swing();
        CHECK(!state.swing_pending());
        CHECK(!state.swing_hit_time());
    }
    SECTION("a second swing while one is pending is refused") {
        REQUIRE(!state.begin_swing(Swing, Start));

        const auto rejection = state.begin_swing(Swing, Start + Millis(2000));

        REQUIRE(rejection);
        CHECK(rejection->error == ActionError::ActionBlocked);
    }
    SECTION("a swing before recovery is refused") {
        REQUIRE(!state.begin_swing(Swing, Start));
        state.complete_swing();

        CHECK(state.begin_swing(Swing, Start + Millis(1000)));
        CHECK(!state.begin_swing(Swing, Start + Millis(2000)));
    }
    SECTION("is_ready does not change anything") {
        REQUIRE(!state.begin_swing(Swing, Start));
        for (auto i = 0; i < 3; ++i)
            CHECK(!state.is_ready(ActionKind::Swing, Start + Millis(100)));
        CHECK(state.next_ready(ActionKind::Swing) == Start + Millis(2000));
        CHECK(f.events.events.empty());
    }
}

TEST_CASE("swinging while casting") {
    Fixture f;
    CombatPolicy policy;

    SECTION("refused while the cast awaits its target") {
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));

        const auto rejection = state.begin_swing(Swing, Start);

        REQUIRE(rejection);
        CHECK(rejection->error == ActionError::ActionBlocked);
        CHECK(state.active_cast());
        CHECK(!state.swing_pending());
    }
    SECTION("refused during the cast delay") {
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));
        state.active_cast()->status = CastStatus::Delaying;

        CHECK(state.begin_swing(Swing, Start));
    }
    SECTION("allowed during the delay when only targeting blocks swings") {
        policy.disable_swing_during_cast_delay = false;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));
        state.active_cast()->status = CastStatus::Delaying;

        CHECK(!state.begin_swing(Swing, Start));
        // The swing interrupted the spell.
        CHECK(!state.active_cast());
        CHECK(f.events.count<Events::CastInterrupted>() == 1);
    }
    SECTION("allowed and the cast kept when swings don't cancel spells") {
        policy.disable_swing_during_cast = false;
        policy.swing_cancels_spell = false;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));

        CHECK(!state.begin_swing(Swing, Start));
        CHECK(state.active_cast());
        CHECK(state.swing_pending());
    }
}

TEST_CASE("casting while swinging") {
    Fixture f;
    CombatPolicy policy;

    SECTION("starting a cast cancels the pending swing") {
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(!state.begin_cast(f.spell, Start));
        CHECK(!state.swing_pending());
        const auto cancelled = f.events.all<Events::ActionCancelled>();
        REQUIRE(cancelled.size() == 1);
        CHECK(cancelled[0].action == ActionKind::Swing);
    }
    SECTION("the swing survives when spells don't cancel swings") {
        policy.spell_cancels_swing = false;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(!state.begin_cast(f.spell, Start));
        CHECK(state.swing_pending());
    }
    SECTION("refused mid swing when swings block casts") {
        policy.swing_blocks_cast = true;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_swing(Swing, Start));

        const auto rejection = state.begin_cast(f.spell, Start);

        REQUIRE(rejection);
        CHECK(rejection->error == ActionError::ActionBlocked);
        CHECK(state.swing_pending());
    }
    SECTION("only one cast at a time") {
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));

        CHECK(state.begin_cast(f.spell, Start));
    }
    SECTION("successive casts get new serials") {
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));
        const auto first = state.active_cast()->serial;
        state.cancel(ActionKind::Cast);
        REQUIRE(!state.begin_cast(f.spell, Start));

        CHECK(state.active_cast()->serial != first);
    }
}

TEST_CASE("cancelling") {
    Fixture f;
    CombatPolicy policy;
    CombatantTimingState state(1, policy, f.logger, f.events);

    SECTION("nothing to cancel is a no-op") {
        for (const auto kind : {ActionKind::Swing, ActionKind::Cast, ActionKind::Bandage, ActionKind::Wand})
            CHECK(!state.cancel(kind));
        CHECK(f.events.events.empty());
    }
    SECTION("cancelling a swing twice") {
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(state.cancel(ActionKind::Swing));
        const auto next_ready = state.next_ready(ActionKind::Swing);
        CHECK(!state.cancel(ActionKind::Swing));

        CHECK(!state.swing_pending());
        CHECK(state.next_ready(ActionKind::Swing) == next_ready);
        CHECK(f.events.count<Events::ActionCancelled>() == 1);
    }
    SECTION("cancelling a cast twice") {
        REQUIRE(!state.begin_cast(f.spell, Start));

        CHECK(state.cancel(ActionKind::Cast, "moved"));
        CHECK(!state.cancel(ActionKind::Cast, "moved"));

        CHECK(!state.active_cast());
        const auto interrupted = f.events.all<Events::CastInterrupted>();
        REQUIRE(interrupted.size() == 1);
        CHECK(interrupted[0].spell == "explosion");
        CHECK(interrupted[0].reason == "moved");
    }
    SECTION("a cancelled swing keeps its recovery") {
        REQUIRE(!state.begin_swing(Swing, Start));
        state.cancel(ActionKind::Swing);

        CHECK(!state.is_ready(ActionKind::Swing, Start + Millis(1000)));
    }
}

TEST_CASE("bandaging") {
    Fixture f;
    CombatPolicy policy;
    const auto bandage_time = Millis(5000);

    SECTION("independent of swinging by default") {
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(!state.begin_bandage(Start, bandage_time));
        CHECK(state.swing_pending());
        CHECK(state.is_bandaging());
        CHECK(!state.begin_cast(f.spell, Start));
        CHECK(state.is_bandaging());
    }
    SECTION("one at a time") {
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_bandage(Start, bandage_time));

        CHECK(state.begin_bandage(Start + bandage_time, bandage_time));
        state.end_bandage();
        CHECK(!state.begin_bandage(Start + bandage_time, bandage_time));
    }
    SECTION("bandaging cancels other actions when configured") {
        policy.bandage_cancels_actions = true;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(!state.begin_bandage(Start, bandage_time));
        CHECK(!state.swing_pending());
    }
    SECTION("actions cancel bandaging when configured") {
        policy.action_cancels_bandage = true;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_bandage(Start, bandage_time));

        CHECK(!state.begin_swing(Swing, Start));
        CHECK(!state.is_bandaging());
        const auto cancelled = f.events.all<Events::ActionCancelled>();
        REQUIRE(cancelled.size() == 1);
        CHECK(cancelled[0].action == ActionKind::Bandage);
    }
}

TEST_CASE("wand use") {
    Fixture f;
    CombatPolicy policy;

    SECTION("cancels a swing and interrupts a cast") {
        policy.disable_swing_during_cast = false;
        policy.swing_cancels_spell = false;
        policy.spell_cancels_swing = false;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(!state.begin_wand(Start, Millis(1000)));
        CHECK(!state.swing_pending());
        CHECK(!state.active_cast());
    }
    SECTION("leaves other actions alone when configured not to") {
        policy.wand_cancels_actions = false;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_swing(Swing, Start));

        CHECK(!state.begin_wand(Start, Millis(1000)));
        CHECK(state.swing_pending());
    }
    SECTION("has its own recovery") {
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_wand(Start, Millis(1000)));

        CHECK(state.begin_wand(Start + Millis(500), Millis(1000)));
        CHECK(!state.begin_wand(Start + Millis(1000), Millis(1000)));
        CHECK(state.is_ready(ActionKind::Swing, Start));
    }
}

TEST_CASE("shared recovery") {
    Fixture f;
    CombatPolicy policy;
    policy.independent_timers = false;
    CombatantTimingState state(1, policy, f.logger, f.events);
    REQUIRE(!state.begin_swing(Swing, Start));
    state.complete_swing();

    CHECK(!state.is_ready(ActionKind::Cast, Start + Millis(1000)));
    CHECK(!state.is_ready(ActionKind::Bandage, Start + Millis(1000)));
    CHECK(state.begin_cast(f.spell, Start + Millis(1000)));
    CHECK(!state.begin_cast(f.spell, Start + Millis(2000)));
}

TEST_CASE("post-cast recovery") {
    Fixture f;
    CombatPolicy policy;

    SECTION("removed by default") {
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));
        state.active_cast()->status = CastStatus::Applied;
        state.finish_cast(Start);

        CHECK(state.is_ready(ActionKind::Cast, Start));
    }
    SECTION("applied after a completed cast when configured") {
        policy.remove_post_cast_recovery = false;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));
        state.active_cast()->status = CastStatus::Applied;
        state.finish_cast(Start);

        CHECK(!state.is_ready(ActionKind::Cast, Start + Millis(999)));
        CHECK(state.is_ready(ActionKind::Cast, Start + policy.post_cast_recovery));
    }
    SECTION("not applied after a fizzle") {
        policy.remove_post_cast_recovery = false;
        CombatantTimingState state(1, policy, f.logger, f.events);
        REQUIRE(!state.begin_cast(f.spell, Start));
        state.active_cast()->status = CastStatus::Fizzled;
        state.finish_cast(Start);

        CHECK(state.is_ready(ActionKind::Cast, Start));
    }
}

TEST_CASE("combat states") {
    Fixture f;
    CombatStates states(CombatPolicy{}, f.logger, f.events);

    SECTION("created on first use") {
        CHECK(!states.find(1));
        auto &state = states.get_or_create(1);
        CHECK(&states.get_or_create(1) == &state);
        CHECK(states.find(1) == &state);
        CHECK(states.size() == 1);
    }
    SECTION("removing interrupts an active cast") {
        REQUIRE(!states.get_or_create(1).begin_cast(f.spell, Start));

        states.remove(1);

        CHECK(!states.find(1));
        CHECK(f.events.count<Events::CastInterrupted>() == 1);
    }
    SECTION("removing an unknown actor is harmless") {
        states.remove(42);
        CHECK(states.size() == 0);
    }
}
