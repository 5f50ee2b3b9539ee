/// @file battle_state.cpp
/// @brief BattleState roster queries.

#include "gbe/battle/battle_state.hpp"

#include <algorithm>

namespace gbe::battle {

namespace {

Side opposite(Side side) {
    return side == Side::Heroes ? Side::Enemies : Side::Heroes;
}

} // namespace

std::vector<BattleUnit*> BattleState::Living(Side side) {
    std::vector<BattleUnit*> result;
    for (auto& unit : Roster(side)) {
        if (unit.isAlive) {
            result.push_back(&unit);
        }
    }
    return result;
}

std::vector<BattleUnit*> BattleState::Allies(const BattleUnit& unit) {
    return Living(unit.GetSide());
}

std::vector<BattleUnit*> BattleState::Opponents(const BattleUnit& unit) {
    return Living(opposite(unit.GetSide()));
}

bool BattleState::HasLiving(Side side) const {
    const auto& roster = Roster(side);
    return std::any_of(roster.begin(), roster.end(),
                       [](const BattleUnit& u) { return u.isAlive; });
}

double BattleState::TotalHp(Side side) const {
    double total = 0.0;
    for (const auto& unit : Roster(side)) {
        if (unit.isAlive) {
            total += unit.stats.hp;
        }
    }
    return total;
}

BattleUnit* BattleState::FindUnit(std::string_view id) {
    for (auto* roster : {&heroes, &enemies}) {
        for (auto& unit : *roster) {
            if (unit.id == id) {
                return &unit;
            }
        }
    }
    return nullptr;
}

const BattleUnit* BattleState::FindUnit(std::string_view id) const {
    for (const auto* roster : {&heroes, &enemies}) {
        for (const auto& unit : *roster) {
            if (unit.id == id) {
                return &unit;
            }
        }
    }
    return nullptr;
}

} // namespace gbe::battle
