/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "CastDescriptor.hpp"
#include "CombatEvents.hpp"
#include "CombatTypes.hpp"
#include "Logging.hpp"
#include "TimingProvider.hpp"
#include "common/CombatPolicy.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>

// Per-actor action timers and the cross-cancellation rules between them.
//
// Swing, cast, bandage and wand each keep a next-ready time. With independent timers they
// recover separately; otherwise they share one. At most one of a pending swing and an active
// cast holds the action lock when the policy asks for it, whereas bandaging never blocks
// anything unless configured to.
class CombatantTimingState {
public:
    CombatantTimingState(const ActorId actor, const CombatPolicy &policy, Logger &logger, EventSink &events);
    ~CombatantTimingState();
    CombatantTimingState(const CombatantTimingState &) = delete;
    CombatantTimingState &operator=(const CombatantTimingState &) = delete;

    [[nodiscard]] ActorId actor() const noexcept { return actor_; }

    // Commits the next swing time from |timing|. The swing stays pending until its hit offset
    // passes and complete_swing() is called.
    std::optional<Rejection> begin_swing(const TimingSnapshot &timing, const Time now);
    // Creates a cast descriptor awaiting its target.
    std::optional<Rejection> begin_cast(Spell &spell, const Time now, const bool from_scroll = false);
    // Whether a new cast would be admitted once any active cast is out of the way. Changes nothing.
    [[nodiscard]] std::optional<Rejection> can_begin_cast(const Time now) const;
    std::optional<Rejection> begin_bandage(const Time now, const Millis duration);
    std::optional<Rejection> begin_wand(const Time now, const Millis recovery);

    // Idempotent. Returns true only if an action was actually stopped.
    bool cancel(const ActionKind kind, std::string_view reason = "cancelled");
    // A pure check of the stored next-ready time.
    [[nodiscard]] bool is_ready(const ActionKind kind, const Time now) const noexcept;
    [[nodiscard]] Time next_ready(const ActionKind kind) const noexcept;

    [[nodiscard]] bool swing_pending() const noexcept { return swing_pending_; }
    [[nodiscard]] std::optional<Time> swing_hit_time() const noexcept;
    void complete_swing() noexcept { swing_pending_ = false; }

    [[nodiscard]] bool is_bandaging() const noexcept { return bandaging_; }
    void end_bandage() noexcept { bandaging_ = false; }

    [[nodiscard]] CastDescriptor *active_cast() noexcept { return cast_.get(); }
    [[nodiscard]] const CastDescriptor *active_cast() const noexcept { return cast_.get(); }
    // Drops the terminal cast, applying post-cast recovery when it completed normally.
    void finish_cast(const Time now);

    [[nodiscard]] Time last_action_time() const noexcept { return last_action_time_; }
    void touch(const Time now) noexcept { last_action_time_ = now; }

private:
    [[nodiscard]] Time &slot(const ActionKind kind) noexcept;
    void set_next_ready(const ActionKind kind, const Time now, const Millis delay);
    [[nodiscard]] std::optional<Rejection> swing_blocked_by_cast() const;
    std::optional<Rejection> blocked(const ActionKind kind, std::string reason) const;

    const ActorId actor_;
    const CombatPolicy &policy_;
    Logger &logger_;
    EventSink &events_;
    // Indexed by ActionKind. Only slot zero is used when the timers are shared.
    std::array<Time, 4> next_ready_{};
    bool swing_pending_{};
    Time swing_hit_time_{};
    bool bandaging_{};
    std::unique_ptr<CastDescriptor> cast_;
    uint64_t next_cast_serial_{1};
    Time last_action_time_{};
};

// Owns the timing state of every actor that has done something combat related.
class CombatStates {
public:
    CombatStates(CombatPolicy policy, Logger &logger, EventSink &events);

    CombatantTimingState &get_or_create(const ActorId actor);
    [[nodiscard]] CombatantTimingState *find(const ActorId actor);
    // Cancels anything in flight and forgets the actor.
    void remove(const ActorId actor);
    [[nodiscard]] size_t size() const noexcept { return states_.size(); }
    [[nodiscard]] const CombatPolicy &policy() const noexcept { return policy_; }

private:
    const CombatPolicy policy_;
    Logger &logger_;
    EventSink &events_;
    std::unordered_map<ActorId, std::unique_ptr<CombatantTimingState>> states_;
};
