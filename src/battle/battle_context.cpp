/// @file battle_context.cpp
/// @brief Unit death bookkeeping.

#include "gbe/battle/battle_context.hpp"

#include "gbe/foundation/battle_logger.hpp"

namespace gbe::battle {

void BattleContext::Kill(BattleUnit& unit, std::optional<std::string> killerId) {
    unit.stats.hp = 0.0;
    unit.isAlive = false;
    unit.cooldown = 0.0;
    unit.statusEffects.clear();
    grid.Release(unit.id);

    foundation::LogContext ctx;
    ctx.unitId = unit.id;
    ctx.tick = state.tick;
    if (killerId) {
        ctx.extra["killer"] = *killerId;
    }
    GBE_LOG_CTX(foundation::LogLevel::Debug, foundation::LogCategory::Combat, "unit died", ctx);

    Emit(DeathEvent{unit.id, std::move(killerId), unit.position});
}

} // namespace gbe::battle
