#pragma once

/// @file event_log.hpp
/// @brief Append-only ordered record of a battle.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "gbe/battle/battle_event.hpp"

namespace gbe::battle {

/// Append-only event log.
///
/// Entries are never reordered or removed; consumers read them in order to
/// replay the battle without re-simulating it.
class EventLog {
public:
    EventLog() = default;

    /// Append an event stamped with @p tick.
    void Append(uint32_t tick, EventPayload payload);

    [[nodiscard]] const std::vector<BattleEvent>& Events() const noexcept { return events_; }
    [[nodiscard]] std::size_t Size() const noexcept { return events_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return events_.empty(); }

    /// Most recent event. Undefined if the log is empty.
    [[nodiscard]] const BattleEvent& Last() const { return events_.back(); }

    /// Number of events of the given type.
    [[nodiscard]] std::size_t Count(EventType type) const;

    /// Copies of all events of the given type, in log order.
    [[nodiscard]] std::vector<BattleEvent> OfType(EventType type) const;

    /// Ordered list of event types, convenient for sequence assertions.
    [[nodiscard]] std::vector<EventType> Types() const;

    auto begin() const noexcept { return events_.begin(); }
    auto end() const noexcept { return events_.end(); }

private:
    std::vector<BattleEvent> events_;
};

} // namespace gbe::battle
