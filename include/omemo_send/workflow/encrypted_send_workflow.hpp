#pragma once
#include "omemo_send/configuration/workflow_config.hpp"
#include "omemo_send/core/failures.hpp"
#include "omemo_send/core/result.hpp"
#include "omemo_send/interfaces/i_encryption_provider.hpp"
#include "omemo_send/interfaces/i_session.hpp"
#include "omemo_send/interfaces/i_trust_decision_strategy.hpp"
#include "omemo_send/models/bare_jid.hpp"
#include "omemo_send/models/device.hpp"
#include "omemo_send/models/encrypt_outcome.hpp"
#include "omemo_send/models/expected_problems.hpp"
#include "omemo_send/models/outgoing_message.hpp"
#include "omemo_send/models/send_result.hpp"
#include "omemo_send/workflow/plain_advisory_sender.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace omemo_send::workflow {

/// Encrypts one message for one recipient and dispatches it
///
/// Runs the provider in a bounded loop. Each attempt ends in one of:
/// - envelope: attached to the message, dispatched, `Sent`
/// - undecided trust: strategy decides, provider records it, retry
/// - missing bundles: devices excluded with an advisory, retry
/// - fetch error: advisory, `Aborted("fetch-error")`
/// - anything else: advisory, Err
///
/// The session is disconnected exactly once before Send returns, on every path.
class EncryptedSendWorkflow {
public:
    EncryptedSendWorkflow(
        interfaces::IEncryptionProvider& provider,
        interfaces::ITrustDecisionStrategy& trust_strategy,
        configuration::WorkflowConfig config = configuration::WorkflowConfig::Default());

    /// @return Sent or Aborted with its reason; Err for unrecoverable failures
    [[nodiscard]] Result<models::SendResult, WorkflowFailure> Send(
        interfaces::ISession& session,
        const models::BareJid& recipient,
        const std::string& plaintext);

    EncryptedSendWorkflow(const EncryptedSendWorkflow&) = delete;
    EncryptedSendWorkflow& operator=(const EncryptedSendWorkflow&) = delete;

private:
    using SendOutcome = Result<models::SendResult, WorkflowFailure>;

    struct Attempt {
        interfaces::ISession& session;
        const models::BareJid& recipient;
        models::OutgoingMessage& message;
        models::ExpectedProblems& expected_problems;
        std::set<models::DeviceAddress>& decided_devices;
        uint32_t number;
    };

    // nullopt: retry with the adjusted state
    std::optional<SendOutcome> Handle(const Attempt& attempt, const models::EncryptedEnvelope& envelope);
    std::optional<SendOutcome> Handle(const Attempt& attempt, const models::TrustUndecided& undecided);
    std::optional<SendOutcome> Handle(const Attempt& attempt, const models::PrepareFailed& failed);
    std::optional<SendOutcome> Handle(const Attempt& attempt, const models::FetchError& error);
    std::optional<SendOutcome> Handle(const Attempt& attempt, const models::EncryptionError& error);

    SendOutcome Fail(const Attempt& attempt, WorkflowFailure failure);

    interfaces::IEncryptionProvider& provider_;
    interfaces::ITrustDecisionStrategy& trust_strategy_;
    configuration::WorkflowConfig config_;
    PlainAdvisorySender advisories_;
};

}
