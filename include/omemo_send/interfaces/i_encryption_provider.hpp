#pragma once
#include "omemo_send/core/result.hpp"
#include "omemo_send/core/failures.hpp"
#include "omemo_send/models/bare_jid.hpp"
#include "omemo_send/models/device.hpp"
#include "omemo_send/models/encrypt_outcome.hpp"
#include "omemo_send/models/expected_problems.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace omemo_send::interfaces {

/// End-to-end encryption backend. Owns sessions, bundles and the trust store;
/// callers only see the classified outcome of each attempt.
class IEncryptionProvider {
public:
    virtual ~IEncryptionProvider() = default;

    [[nodiscard]] virtual models::EncryptOutcome Encrypt(
        const std::string& plaintext,
        const std::vector<models::BareJid>& recipients,
        const models::ExpectedProblems& expected_problems) = 0;

    [[nodiscard]] virtual Result<Unit, WorkflowFailure> RecordTrust(
        const models::DeviceAddress& address,
        const models::IdentityKey& identity_key,
        models::TrustDecision decision) = 0;

    /// Namespace of the encrypted payload element, used for the EME annotation
    [[nodiscard]] virtual std::string_view EncryptionNamespace() const = 0;
};

}
