#pragma once

/// @file gbe.hpp
/// @brief Umbrella header for the grid battle engine.

#include "gbe/core/result.hpp"
#include "gbe/version.hpp"

#include "gbe/foundation/battle_error.hpp"
#include "gbe/foundation/battle_logger.hpp"
#include "gbe/foundation/battle_result.hpp"
#include "gbe/foundation/config_manager.hpp"
#include "gbe/foundation/error_code.hpp"

#include "gbe/battle/battle_setup.hpp"
#include "gbe/battle/battle_simulator.hpp"
#include "gbe/battle/battle_state.hpp"
#include "gbe/battle/engine_config.hpp"
