#pragma once

#include "omemo_send/core/constants.hpp"
#include "omemo_send/core/failures.hpp"
#include "omemo_send/core/result.hpp"

#include <cstdint>
#include <string>

namespace omemo_send::configuration {

/// Configuration for the encrypted send workflow
///
/// Each recoverable outcome (undecided trust, missing bundles) triggers an
/// immediate retry with adjusted state. The attempt budget caps those retries
/// so a provider that keeps reporting the same condition cannot keep the
/// workflow alive forever.
///
/// @example
/// ```cpp
/// auto config = WorkflowConfig::Default();
///
/// auto strict = WorkflowConfig::WithMaxAttempts(4);
/// if (strict.IsOk()) {
///     EncryptedSendWorkflow workflow(provider, strategy, strict.Unwrap());
/// }
/// ```
class WorkflowConfig {
public:
    /// Default attempt budget (WorkflowConstants::DEFAULT_MAX_ATTEMPTS)
    [[nodiscard]] static constexpr WorkflowConfig Default() noexcept {
        return WorkflowConfig(WorkflowConstants::DEFAULT_MAX_ATTEMPTS);
    }

    /// Single encryption attempt, no recovery
    ///
    /// Any undecided device or missing bundle ends the run with
    /// `Aborted("retry-limit")`.
    [[nodiscard]] static constexpr WorkflowConfig SingleAttempt() noexcept {
        return WorkflowConfig(WorkflowConstants::MINIMUM_MAX_ATTEMPTS);
    }

    /// Custom attempt budget
    ///
    /// @param max_attempts Must be at least 1
    [[nodiscard]] static Result<WorkflowConfig, ConfigFailure> WithMaxAttempts(
        const uint32_t max_attempts) {
        if (max_attempts < WorkflowConstants::MINIMUM_MAX_ATTEMPTS) {
            return Result<WorkflowConfig, ConfigFailure>::Err(
                ConfigFailure::InvalidValue(
                    "max attempts must be at least " +
                    std::to_string(WorkflowConstants::MINIMUM_MAX_ATTEMPTS)));
        }
        return Result<WorkflowConfig, ConfigFailure>::Ok(WorkflowConfig(max_attempts));
    }

    [[nodiscard]] constexpr uint32_t MaxAttempts() const noexcept {
        return max_attempts_;
    }

    [[nodiscard]] constexpr bool operator==(const WorkflowConfig& other) const noexcept {
        return max_attempts_ == other.max_attempts_;
    }

    [[nodiscard]] constexpr bool operator!=(const WorkflowConfig& other) const noexcept {
        return max_attempts_ != other.max_attempts_;
    }

private:
    explicit constexpr WorkflowConfig(const uint32_t max_attempts) noexcept
        : max_attempts_(max_attempts) {}

    uint32_t max_attempts_;
};

} // namespace omemo_send::configuration
