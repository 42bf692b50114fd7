#pragma once
#include "omemo_send/models/bare_jid.hpp"
#include "omemo_send/models/device.hpp"
#include "omemo_send/models/encrypted_envelope.hpp"
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace omemo_send::models {

enum class DeviceProblemKind : uint8_t {
    MissingBundle,
    NoSession,
    Untrusted,
    NoEligibleDevices,
    Other
};

[[nodiscard]] std::string_view ToString(DeviceProblemKind kind) noexcept;

struct DeviceProblem {
    DeviceProblemKind kind;
    DeviceAddress address;
    std::string detail;
};

/// A device has no recorded trust decision; encryption is refused until one is made.
struct TrustUndecided {
    DeviceAddress address;
    IdentityKey identity_key;
};

/// The provider exhausted what it could prepare on its own. Each problem must
/// be resolved or listed as expected on the next attempt.
struct PrepareFailed {
    std::vector<DeviceProblem> problems;
};

/// Network error or timeout while retrieving a recipient's device information.
struct FetchError {
    bool timed_out = false;
    std::string detail;
};

/// Any failure the provider does not classify.
struct EncryptionError {
    std::string detail;
};

using EncryptOutcome = std::variant<
    EncryptedEnvelope,
    TrustUndecided,
    PrepareFailed,
    FetchError,
    EncryptionError>;

}
