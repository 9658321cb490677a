/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Engine.hpp"
#include "CatchFormatters.hpp"
#include "FakeWorld.hpp"
#include "MemFile.hpp"

#include <catch2/catch.hpp>

using namespace std::literals;

namespace {

struct NoAttacks : AttackResolver {
    void resolve_swing(Actor &, Actor &) override {}
};

struct OpenLedger : Duels::GoldLedger {
    bool debit(const ActorId, const int amount) override {
        escrowed += amount;
        return true;
    }
    void refund(const ActorId, const int amount) override { escrowed -= amount; }
    void credit(const ActorId, const int) override {}
    int escrowed{};
};

struct NullArenaServices : Duels::ArenaServices {
    void lock_region(const Duels::Arena &) override {}
    void release_region(const Duels::Arena &) override {}
    void move_to_arena(const ActorId, const Duels::Arena &, const size_t) override {}
    void return_from_arena(const ActorId, const Duels::Arena &) override {}
    void restore(const ActorId) override {}
    void clear_scoring(const ActorId, const ActorId) override {}
};

struct Harness {
    Harness() {
        world.add(1);
        world.add(2);
    }
    void advance(const Millis by) {
        world.advance(by);
        engine.poll();
    }

    test::MemFile log_file;
    Logger logger{log_file.file()};
    test::RecordingSink events;
    test::FakeWorld world;
    NoAttacks resolver;
    OpenLedger ledger;
    NullArenaServices arena_services;
    Configuration config;
    Engine engine{config, world, resolver, ledger, arena_services, events, logger};
};

}

TEST_CASE("engine wiring") {
    Harness h;

    CHECK(h.engine.timing().name() == "weapon table");
    CHECK(!h.engine.is_running());
    CHECK(h.log_file.written().find("Combat engine using weapon table timings, independent timers")
          != std::string_view::npos);
    h.engine.start();
    CHECK(h.engine.is_running());
    h.engine.stop();
    CHECK(!h.engine.is_running());
}

TEST_CASE("bandaging through the engine") {
    Harness h;

    SECTION("finishes after its duration") {
        CHECK(!h.engine.request_bandage(1, 3s));
        REQUIRE(h.engine.states().find(1));
        CHECK(h.engine.states().find(1)->is_bandaging());

        h.advance(2999ms);
        CHECK(h.engine.states().find(1)->is_bandaging());
        h.advance(1ms);
        CHECK(!h.engine.states().find(1)->is_bandaging());
    }
    SECTION("the dead can't bandage") {
        h.world.actor(1).alive = false;

        const auto rejection = h.engine.request_bandage(1, 3s);

        REQUIRE(rejection);
        CHECK(rejection->error == ActionError::ActionBlocked);
        const auto rejected = h.events.all<Events::ActionRejected>();
        REQUIRE(rejected.size() == 1);
        CHECK(rejected[0].actor == 1);
        CHECK(rejected[0].action == ActionKind::Bandage);
    }
    SECTION("nor can those who aren't there") { CHECK(h.engine.request_bandage(42, 3s)); }
    SECTION("cancelled") {
        REQUIRE(!h.engine.request_bandage(1, 3s));

        CHECK(h.engine.cancel(1, ActionKind::Bandage, "moved"));
        CHECK(!h.engine.states().find(1)->is_bandaging());
        CHECK(!h.engine.cancel(2, ActionKind::Bandage, "moved"));
    }
}

TEST_CASE("removing an actor from the engine") {
    Harness h;
    h.engine.duels().add_arena({.id = 1, .name = "the pit", .type = Duels::DuelType::Money1v1},
                               std::make_unique<Duels::StandardRuleset>());
    REQUIRE(!h.engine.request_bandage(1, 3s));
    REQUIRE(!h.engine.duels().issue_challenge(1, 2, 1, 100, false));
    REQUIRE(h.ledger.escrowed == 100);

    h.engine.remove_actor(1);
    h.world.remove(1);

    CHECK(!h.engine.states().find(1));
    CHECK(!h.engine.duels().pending_challenge(2));
    CHECK(h.ledger.escrowed == 0);
    h.world.advance(31s);
    CHECK(h.engine.poll() == 0);
    CHECK(!h.engine.states().find(1));
}
