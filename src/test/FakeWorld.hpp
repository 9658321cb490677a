#pragma once

#include "CombatEvents.hpp"
#include "Spell.hpp"
#include "World.hpp"

#include <catch2/catch.hpp>
#include <catch2/trompeloeil.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace test {

// A combatant whose every attribute the test can poke directly.
struct FakeActor : Actor {
    FakeActor(ActorId id, std::string name) : id_(id), name_(std::move(name)) {}

    ActorId id() const override { return id_; }
    std::string_view name() const override { return name_; }
    bool is_player() const override { return player; }
    bool is_alive() const override { return alive; }
    bool is_deleted() const override { return deleted; }
    int dex() const override { return dexterity; }
    int stamina() const override { return stam; }
    const Weapon *weapon() const override { return wielding ? &*wielding : nullptr; }
    int skill(std::string_view) const override { return skill_level; }
    int mana() const override { return mana_points; }
    void set_mana(int mana) override { mana_points = mana; }
    bool in_line_of_sight(const Actor &) const override { return line_of_sight; }
    std::optional<ActorId> opponent() const override { return fighting; }

    ActorId id_;
    std::string name_;
    bool player{true};
    bool alive{true};
    bool deleted{};
    int dexterity{100};
    int stam{100};
    std::optional<Weapon> wielding;
    int skill_level{};
    int mana_points{100};
    bool line_of_sight{true};
    std::optional<ActorId> fighting;
};

class FakeWorld : public World {
public:
    Actor *find_actor(ActorId id) override {
        auto it = actors_.find(id);
        return it == actors_.end() ? nullptr : it->second.get();
    }
    Time current_time() const override { return now_; }

    FakeActor &add(ActorId id, std::string name = "") {
        if (name.empty())
            name = "actor" + std::to_string(id);
        return *(actors_[id] = std::make_unique<FakeActor>(id, std::move(name)));
    }
    FakeActor &actor(ActorId id) { return *actors_.at(id); }
    void remove(ActorId id) { actors_.erase(id); }

    void advance(Millis by) { now_ += by; }
    Time now() const { return now_; }

private:
    // Fixed so time only moves when a test says so.
    Time now_{Clock::from_time_t(1'700'000'000)};
    std::unordered_map<ActorId, std::unique_ptr<FakeActor>> actors_;
};

// Keeps everything published, in order.
struct RecordingSink : EventSink {
    void publish(const Event &event) override { events.push_back(event); }

    template <typename T>
    [[nodiscard]] std::vector<T> all() const {
        std::vector<T> found;
        for (const auto &event : events)
            if (const auto *typed = std::get_if<T>(&event))
                found.push_back(*typed);
        return found;
    }
    template <typename T>
    [[nodiscard]] size_t count() const {
        return all<T>().size();
    }
    void clear() { events.clear(); }

    std::vector<Event> events;
};

struct MockSpell : trompeloeil::mock_interface<Spell> {
    IMPLEMENT_CONST_MOCK0(name);
    IMPLEMENT_CONST_MOCK0(mana_cost);
    IMPLEMENT_MOCK1(consume_reagents);
    IMPLEMENT_CONST_MOCK1(has_reflection);
    IMPLEMENT_MOCK2(apply_effect);
    IMPLEMENT_CONST_MOCK0(needs_line_of_sight);
};

}
