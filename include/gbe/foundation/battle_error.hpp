#pragma once

/// @file battle_error.hpp
/// @brief Engine error type used with Result<T, BattleError>.

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "gbe/foundation/error_code.hpp"

namespace gbe::foundation {

/// Error carrying a code, a human-readable message, and the ids of the
/// unit and ability the error refers to, when there is one.
class BattleError {
public:
    BattleError() = default;

    explicit BattleError(ErrorCode code)
        : code_(code) {}

    BattleError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    BattleError(ErrorCode code, std::string message,
                std::string unitId, std::optional<std::string> abilityId = std::nullopt)
        : code_(code),
          message_(std::move(message)),
          unitId_(std::move(unitId)),
          abilityId_(std::move(abilityId)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Id of the offending unit, if the error concerns one.
    [[nodiscard]] const std::optional<std::string>& unitId() const noexcept { return unitId_; }

    /// Id of the offending ability, if the error concerns one.
    [[nodiscard]] const std::optional<std::string>& abilityId() const noexcept {
        return abilityId_;
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::optional<std::string> unitId_;
    std::optional<std::string> abilityId_;
};

} // namespace gbe::foundation
