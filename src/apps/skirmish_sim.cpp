#include "Engine.hpp"
#include "common/Configuration.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_map>

// skirmish_sim - drives the combat pulse with a crowd of simulated fighters paired off against
// each other, and reports the pulse metrics. Handy for sizing the tick period against a
// realistic number of combatants before changing it on the live game.
//
// By default time is simulated, so the run finishes as fast as the pulse can go. --realtime
// runs against the wall clock instead, sleeping between pulses as the game would.

template <>
struct fmt::formatter<lyra::cli> : ostream_formatter {};

namespace {

const Weapon Longsword{.item_id = 0x13B8, .weapon_class = WeaponClass::OneHandedSword, .speed = 30, .name = "longsword"};

class SimActor : public Actor {
public:
    SimActor(ActorId id, int dex) : id_(id), name_(fmt::format("fighter{}", id)), dex_(dex) {}

    ActorId id() const override { return id_; }
    std::string_view name() const override { return name_; }
    bool is_player() const override { return true; }
    bool is_alive() const override { return true; }
    bool is_deleted() const override { return false; }
    int dex() const override { return dex_; }
    int stamina() const override { return dex_; }
    const Weapon *weapon() const override { return &Longsword; }
    int skill(std::string_view) const override { return 0; }
    int mana() const override { return 0; }
    void set_mana(int) override {}
    bool in_line_of_sight(const Actor &) const override { return true; }
    std::optional<ActorId> opponent() const override { return opponent_; }

    void set_opponent(ActorId opponent) { opponent_ = opponent; }

private:
    ActorId id_;
    std::string name_;
    int dex_;
    std::optional<ActorId> opponent_;
};

class SimWorld : public World {
public:
    explicit SimWorld(bool realtime) : realtime_(realtime), now_(Clock::now()) {}

    Actor *find_actor(ActorId id) override {
        auto it = actors_.find(id);
        return it == actors_.end() ? nullptr : it->second.get();
    }
    Time current_time() const override { return realtime_ ? Clock::now() : now_; }

    void advance(Millis by) { now_ += by; }
    SimActor &add(ActorId id, int dex) { return *(actors_[id] = std::make_unique<SimActor>(id, dex)); }

private:
    bool realtime_;
    Time now_;
    std::unordered_map<ActorId, std::unique_ptr<SimActor>> actors_;
};

// Counts swings, and throws on every Nth to exercise the pulse's fault isolation.
class SimResolver : public AttackResolver {
public:
    explicit SimResolver(size_t fault_every) : fault_every_(fault_every) {}

    void resolve_swing(Actor &attacker, Actor &) override {
        ++swings_;
        if (fault_every_ && swings_ % fault_every_ == 0)
            throw std::runtime_error(fmt::format("simulated fault on {}'s swing", attacker.name()));
    }
    [[nodiscard]] size_t swings() const noexcept { return swings_; }

private:
    size_t fault_every_;
    size_t swings_{};
};

struct NullLedger : Duels::GoldLedger {
    bool debit(ActorId, int) override { return true; }
    void refund(ActorId, int) override {}
    void credit(ActorId, int) override {}
};

struct NullArenaServices : Duels::ArenaServices {
    void lock_region(const Duels::Arena &) override {}
    void release_region(const Duels::Arena &) override {}
    void move_to_arena(ActorId, const Duels::Arena &, size_t) override {}
    void return_from_arena(ActorId, const Duels::Arena &) override {}
    void restore(ActorId) override {}
    void clear_scoring(ActorId, ActorId) override {}
};

struct CountingSink : EventSink {
    void publish(const Event &) override { ++published; }
    size_t published{};
};

}

int main(int argc, const char **argv) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_st>();
    auto logger = spdlog::logger("skirmish_sim", sink);
    bool help{};
    bool verbose{};
    bool realtime{};
    size_t combatants{500};
    size_t ticks{100};
    size_t fault_every{};
    auto cli = lyra::cli() | lyra::help(help).description("Load test the combat pulse with simulated fighters")
               | lyra::opt(combatants, "count")["-c"]["--combatants"]("number of simulated fighters (default 500)")
               | lyra::opt(ticks, "count")["-t"]["--ticks"]("number of pulses to run (default 100)")
               | lyra::opt(fault_every, "n")["-f"]["--fault-every"]("throw from every nth swing (default never)")
               | lyra::opt(realtime)["-r"]["--realtime"]("run against the wall clock")
               | lyra::opt(verbose)["-V"]("verbose logging");

    auto result = cli.parse({argc, argv});
    if (!result) {
        fmt::print("Error in command line: {}\n", result.message());
        exit(1);
    } else if (help) {
        fmt::print("{}", cli);
        exit(0);
    }
    if (verbose) {
        logger.set_level(spdlog::level::debug);
    }

    std::unique_ptr<Configuration> config;
    try {
        config = std::make_unique<Configuration>();
    } catch (const ConfigurationError &e) {
        logger.critical("Bad configuration: {}", e.what());
        exit(1);
    }

    SimWorld world(realtime);
    SimResolver resolver(fault_every);
    NullLedger ledger;
    NullArenaServices arena_services;
    CountingSink events;
    Logger engine_logger;
    Engine engine(*config, world, resolver, ledger, arena_services, events, engine_logger);

    for (ActorId id = 1; id <= combatants; ++id) {
        auto &actor = world.add(id, 75 + static_cast<int>(id % 50));
        // Pair neighbours off: 1 fights 2, 3 fights 4 and so on. An odd one out fights 1.
        actor.set_opponent(id % 2 ? (id < combatants ? id + 1 : 1) : id - 1);
    }
    engine.start();
    for (ActorId id = 1; id <= combatants; ++id)
        engine.pulse().register_combatant(id);
    logger.info("Running {} pulses over {} combatants ({} time)", ticks, combatants,
                realtime ? "wall clock" : "simulated");

    const auto period = config->pulse_settings().tick_period;
    if (realtime) {
        engine.run_for(period * static_cast<long>(ticks));
    } else {
        for (size_t tick = 0; tick < ticks; ++tick) {
            world.advance(period);
            engine.poll();
        }
    }
    const auto metrics = engine.pulse().metrics();
    engine.stop();

    logger.info("Pulses run:        {}", metrics.total_ticks);
    logger.info("Average tick:      {}us", metrics.average_tick.count());
    logger.info("Maximum tick:      {}us", metrics.max_tick.count());
    logger.info("99th percentile:   {}us", metrics.p99_tick.count());
    logger.info("Still in combat:   {}", metrics.active_combatants);
    logger.info("Throttle events:   {}", metrics.throttle_events);
    logger.info("Swings resolved:   {}", resolver.swings());
    logger.info("Faults isolated:   {}", metrics.faults);
    logger.debug("Events published:  {}", events.published);
    if (metrics.throttle_events)
        logger.warn("The pulse overran its {}ms period {} times", metrics.period.count(), metrics.throttle_events);
}
