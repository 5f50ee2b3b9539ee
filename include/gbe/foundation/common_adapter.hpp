#pragma once

/// @file common_adapter.hpp
/// @brief Aggregate header for the engine's error, result and configuration types.

#include "gbe/foundation/battle_error.hpp"
#include "gbe/foundation/battle_result.hpp"
#include "gbe/foundation/config_manager.hpp"
#include "gbe/foundation/error_code.hpp"
