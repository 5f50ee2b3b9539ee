#pragma once

/// @file battle_result.hpp
/// @brief BattleResult<T> type alias for engine error handling.

#include "gbe/core/result.hpp"
#include "gbe/foundation/battle_error.hpp"

namespace gbe::foundation {

/// Result type specialized with BattleError.
///
/// Example:
/// @code
///   BattleResult<int> parseWidth(int width) {
///       if (width < 2) {
///           return BattleResult<int>::err(
///               BattleError(ErrorCode::InvalidGridSize, "grid too narrow"));
///       }
///       return BattleResult<int>::ok(width);
///   }
/// @endcode
template <typename T>
using BattleResult = gbe::Result<T, BattleError>;

}  // namespace gbe::foundation
