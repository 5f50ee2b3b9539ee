#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the battle engine.

#include <cstdint>
#include <string_view>

namespace gbe::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read off the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,

    // Roster validation (0x0900 - 0x09FF)
    EmptyRoster = 0x0900,
    DuplicateUnitId = 0x0901,
    InvalidUnitStats = 0x0902,
    InvalidAbility = 0x0903,
    InvalidAbilityEffect = 0x0904,
    UnknownStatusType = 0x0905,

    // Grid (0x0A00 - 0x0AFF)
    InvalidGridSize = 0x0A00,
    PositionOutOfBounds = 0x0A01,
    PositionConflict = 0x0A02,

    // Battle (0x0B00 - 0x0BFF)
    BattleFinished = 0x0B00,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Roster";
        case 0x0A00: return "Grid";
        case 0x0B00: return "Battle";
        default: return "Unknown";
    }
}

} // namespace gbe::foundation
