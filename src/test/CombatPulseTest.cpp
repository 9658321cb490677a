/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "CombatPulse.hpp"
#include "CatchFormatters.hpp"
#include "FakeWorld.hpp"
#include "MemFile.hpp"

#include <catch2/catch.hpp>
#include <catch2/trompeloeil.hpp>

#include <stdexcept>
#include <thread>
#include <unordered_map>

using trompeloeil::_;

namespace {

struct MockAttackResolver : trompeloeil::mock_interface<AttackResolver> {
    IMPLEMENT_MOCK2(resolve_swing);
};

struct Harness {
    explicit Harness(const PulseSettings &settings = {})
        : pulse(world, timers, states, timing, resolver, settings, events, logger) {}

    // Moves time on one pulse at a time, as the game loop would.
    void advance(const Millis by) {
        for (auto elapsed = Millis::zero(); elapsed < by; elapsed += Millis(50)) {
            world.advance(Millis(50));
            timers.run_due(world.now());
        }
    }

    // Pairs |first| and |second| off against each other.
    void fight(const ActorId first, const ActorId second) {
        world.add(first).fighting = second;
        world.add(second).fighting = first;
    }

    test::MemFile log_file;
    Logger logger{log_file.file()};
    test::RecordingSink events;
    test::FakeWorld world;
    TimerQueue timers{logger};
    CombatStates states{CombatPolicy{}, logger, events};
    WeaponTableTimingProvider timing;
    MockAttackResolver resolver;
    CombatPulse pulse;
};

}

TEST_CASE("pulse lifecycle") {
    Harness h;
    CHECK(h.pulse.state() == PulseState::Uninitialized);

    h.pulse.start();
    CHECK(h.pulse.state() == PulseState::Running);
    CHECK(h.timers.size() == 1);

    h.world.add(1);
    h.pulse.register_combatant(1);
    h.pulse.stop();

    CHECK(h.pulse.state() == PulseState::Stopped);
    CHECK(!h.pulse.is_registered(1));
    h.advance(Millis(500));
    CHECK(h.pulse.metrics().total_ticks == 0);

    h.pulse.start();
    h.advance(Millis(100));
    CHECK(h.pulse.metrics().total_ticks == 2);
}

TEST_CASE("pulse swings") {
    Harness h;
    h.fight(1, 2);
    h.pulse.start();
    h.pulse.register_combatant(1);

    SECTION("a swing lands at its hit offset, then waits out the interval") {
        // Unarmed: 2000ms between swings, landing 300ms in. The first swing starts on the first pulse.
        {
            FORBID_CALL(h.resolver, resolve_swing(_, _));
            h.advance(Millis(300));
        }
        {
            REQUIRE_CALL(h.resolver, resolve_swing(_, _)).LR_WITH(_1.id() == 1 && _2.id() == 2);
            h.advance(Millis(50));
        }
        {
            FORBID_CALL(h.resolver, resolve_swing(_, _));
            h.advance(Millis(1950));
        }
        REQUIRE_CALL(h.resolver, resolve_swing(_, _));
        h.advance(Millis(300));
    }
    SECTION("no swings once unregistered") {
        FORBID_CALL(h.resolver, resolve_swing(_, _));
        h.pulse.unregister_combatant(1);
        h.advance(Millis(3000));
    }
    SECTION("the dead don't swing") {
        FORBID_CALL(h.resolver, resolve_swing(_, _));
        h.world.actor(1).alive = false;
        h.advance(Millis(3000));
    }
    SECTION("no swing at a dead opponent") {
        FORBID_CALL(h.resolver, resolve_swing(_, _));
        h.world.actor(2).alive = false;
        h.advance(Millis(3000));
    }
    SECTION("a swing whose target dies before it lands hits nobody") {
        FORBID_CALL(h.resolver, resolve_swing(_, _));
        h.advance(Millis(100));
        h.world.actor(2).alive = false;
        h.advance(Millis(300));
        CHECK(!h.states.find(1)->swing_pending());
    }
}

TEST_CASE("pulse roster housekeeping") {
    Harness h;
    h.pulse.start();
    ALLOW_CALL(h.resolver, resolve_swing(_, _));

    SECTION("actors who've left the world are dropped") {
        h.pulse.register_combatant(3);
        REQUIRE(h.states.find(3));

        h.advance(Millis(50));

        CHECK(!h.pulse.is_registered(3));
        CHECK(!h.states.find(3));
    }
    SECTION("deleted actors are dropped") {
        h.world.add(3).deleted = true;
        h.pulse.register_combatant(3);

        h.advance(Millis(50));

        CHECK(!h.pulse.is_registered(3));
    }
    SECTION("idle actors are evicted") {
        h.world.add(1);
        h.pulse.register_combatant(1);

        h.advance(Millis(5000));
        CHECK(h.pulse.is_registered(1));
        h.advance(Millis(50));

        CHECK(!h.pulse.is_registered(1));
        CHECK(!h.states.find(1));
        CHECK(h.pulse.metrics().active_combatants == 0);
    }
    SECTION("fighting keeps an actor registered") {
        h.fight(1, 2);
        h.pulse.register_combatant(1);

        h.advance(Millis(10000));

        CHECK(h.pulse.is_registered(1));
    }
    SECTION("casters aren't evicted") {
        test::MockSpell spell;
        ALLOW_CALL(spell, name()).RETURN("Explosion");
        h.world.add(1);
        h.pulse.register_combatant(1);
        REQUIRE(!h.states.get_or_create(1).begin_cast(spell, h.world.now()));

        h.advance(Millis(6000));

        CHECK(h.pulse.is_registered(1));
        h.states.remove(1);
    }
}

TEST_CASE("pulse under load") {
    Harness h;
    constexpr ActorId Combatants = 500;
    constexpr ActorId Faulty = 7;
    for (ActorId id = 1; id <= Combatants; id += 2)
        h.fight(id, id + 1);
    h.pulse.start();
    for (ActorId id = 1; id <= Combatants; ++id)
        h.pulse.register_combatant(id);

    std::unordered_map<ActorId, int> swings;
    auto resolve = [&swings](const Actor &attacker) {
        ++swings[attacker.id()];
        if (attacker.id() == Faulty)
            throw std::runtime_error("no such weapon");
    };
    ALLOW_CALL(h.resolver, resolve_swing(_, _)).LR_SIDE_EFFECT(resolve(_1));

    h.advance(Millis(5000));

    const auto metrics = h.pulse.metrics();
    CHECK(metrics.total_ticks == 100);
    CHECK(metrics.active_combatants == Combatants);
    // Swings land at 350ms, 2350ms and 4350ms.
    CHECK(metrics.faults == 3);
    CHECK(swings.size() == Combatants);
    for (const auto &[id, count] : swings) {
        INFO("actor " << id);
        CHECK(count == 3);
    }
    CHECK(metrics.max_tick >= metrics.average_tick);
    CHECK(metrics.period == Millis(50));
    CHECK(h.log_file.written().find("Combat pulse skipped actor 7 this tick: no such weapon")
          != std::string_view::npos);
}

TEST_CASE("pulse throttling") {
    Harness h;
    h.fight(1, 2);
    h.pulse.start();
    h.pulse.register_combatant(1);
    ALLOW_CALL(h.resolver, resolve_swing(_, _)).SIDE_EFFECT(std::this_thread::sleep_for(Millis(60)));

    h.advance(Millis(350));

    const auto metrics = h.pulse.metrics();
    CHECK(metrics.throttle_events == 1);
    CHECK(metrics.max_tick >= Millis(60));
    const auto throttled = h.events.all<Events::Throttled>();
    REQUIRE(throttled.size() == 1);
    CHECK(throttled[0].period == Millis(50));
    // A slow pulse doesn't stop the next one.
    h.advance(Millis(100));
    CHECK(h.pulse.metrics().total_ticks == 9);
}
