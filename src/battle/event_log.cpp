/// @file event_log.cpp
/// @brief EventLog and event naming.

#include "gbe/battle/event_log.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

namespace gbe::battle {

namespace {

constexpr std::array<std::string_view, std::variant_size_v<EventPayload>> kEventNames = {
    "BattleStart", "Tick", "Move", "Attack", "AbilityUsed", "Damage", "Heal",
    "Evaded", "CriticalHit", "StatusApplied", "StatusExpired", "Death",
    "WaveStart", "WaveComplete", "WaveTransition", "Victory", "Defeat"
};

} // namespace

std::string_view EventTypeName(EventType type) noexcept {
    auto idx = static_cast<std::size_t>(type);
    return idx < kEventNames.size() ? kEventNames[idx] : "Unknown";
}

void EventLog::Append(uint32_t tick, EventPayload payload) {
    events_.push_back(BattleEvent{tick, std::move(payload)});
}

std::size_t EventLog::Count(EventType type) const {
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [type](const BattleEvent& e) { return e.Type() == type; }));
}

std::vector<BattleEvent> EventLog::OfType(EventType type) const {
    std::vector<BattleEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [type](const BattleEvent& e) { return e.Type() == type; });
    return result;
}

std::vector<EventType> EventLog::Types() const {
    std::vector<EventType> result;
    result.reserve(events_.size());
    for (const auto& e : events_) {
        result.push_back(e.Type());
    }
    return result;
}

} // namespace gbe::battle
