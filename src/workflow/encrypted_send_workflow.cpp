#include "omemo_send/workflow/encrypted_send_workflow.hpp"
#include "omemo_send/core/constants.hpp"
#include "omemo_send/models/encryption_method.hpp"
#include "omemo_send/workflow/session_guard.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <variant>
#include <vector>

namespace omemo_send::workflow {

using models::SendResult;

namespace {

std::string DescribeProblems(const std::vector<const models::DeviceProblem*>& problems) {
    std::string description;
    for (const auto* problem : problems) {
        if (!description.empty()) {
            description += "; ";
        }
        description += fmt::format("device {} of {}: {}",
                                   problem->address.device,
                                   problem->address.jid.ToString(),
                                   models::ToString(problem->kind));
        if (!problem->detail.empty()) {
            description += fmt::format(" ({})", problem->detail);
        }
    }
    return description;
}

}

EncryptedSendWorkflow::EncryptedSendWorkflow(
    interfaces::IEncryptionProvider& provider,
    interfaces::ITrustDecisionStrategy& trust_strategy,
    const configuration::WorkflowConfig config)
    : provider_(provider)
    , trust_strategy_(trust_strategy)
    , config_(config) {
}

Result<SendResult, WorkflowFailure> EncryptedSendWorkflow::Send(
    interfaces::ISession& session,
    const models::BareJid& recipient,
    const std::string& plaintext) {
    SessionGuard guard(session);

    auto method = models::EncryptionMethod::ForNamespace(provider_.EncryptionNamespace());
    if (method.IsErr()) {
        spdlog::error("{}", method.UnwrapErr().message);
        advisories_.Notify(session, recipient,
                           fmt::format(AdvisoryMessages::ENCRYPTION_ERROR, method.UnwrapErr().message));
        return SendOutcome::Err(std::move(method).UnwrapErr());
    }

    auto message = models::OutgoingMessage::Chat(recipient);
    message.SetEncryptionMethod(std::move(method).Unwrap());

    models::ExpectedProblems expected_problems;
    std::set<models::DeviceAddress> decided_devices;
    const std::vector<models::BareJid> recipients{recipient};

    for (uint32_t number = 1; number <= config_.MaxAttempts(); ++number) {
        spdlog::debug("Encryption attempt {} for {} ({} device(s) excluded)",
                      number, recipient.ToString(), expected_problems.Size());

        const Attempt attempt{session, recipient, message, expected_problems, decided_devices, number};
        const auto outcome = provider_.Encrypt(plaintext, recipients, expected_problems);
        auto step = std::visit(
            [this, &attempt](const auto& value) { return Handle(attempt, value); },
            outcome);
        if (step.has_value()) {
            return std::move(*step);
        }
    }

    spdlog::warn("Giving up on {} after {} attempts", recipient.ToString(), config_.MaxAttempts());
    advisories_.Notify(session, recipient,
                       fmt::format(AdvisoryMessages::RETRY_LIMIT, recipient.ToString(), config_.MaxAttempts()));
    return SendOutcome::Ok(SendResult::Aborted(
        std::string(WorkflowConstants::REASON_RETRY_LIMIT), config_.MaxAttempts()));
}

std::optional<EncryptedSendWorkflow::SendOutcome> EncryptedSendWorkflow::Handle(
    const Attempt& attempt,
    const models::EncryptedEnvelope& envelope) {
    attempt.message.AttachEnvelope(envelope);
    auto dispatched = attempt.session.SendMessage(attempt.message);
    if (dispatched.IsErr()) {
        return Fail(attempt, WorkflowFailure::FromSessionFailure(dispatched.UnwrapErr()));
    }
    spdlog::info("Encrypted message sent to {}", attempt.recipient.ToString());
    return SendOutcome::Ok(SendResult::Sent(attempt.number));
}

std::optional<EncryptedSendWorkflow::SendOutcome> EncryptedSendWorkflow::Handle(
    const Attempt& attempt,
    const models::TrustUndecided& undecided) {
    const auto& address = undecided.address;
    if (!attempt.decided_devices.insert(address).second) {
        spdlog::warn("Device {} of {} is still undecided after a recorded decision",
                     address.device, address.jid.ToString());
        advisories_.Notify(attempt.session, attempt.recipient,
                           fmt::format(AdvisoryMessages::TRUST_NOT_APPLIED,
                                       address.device, address.jid.ToString()));
        return SendOutcome::Ok(SendResult::Aborted(
            std::string(WorkflowConstants::REASON_TRUST_NOT_APPLIED), attempt.number));
    }

    const auto decision = trust_strategy_.Decide(address.jid, address.device, undecided.identity_key);
    auto recorded = provider_.RecordTrust(address, undecided.identity_key, decision);
    if (recorded.IsErr()) {
        return Fail(attempt, WorkflowFailure::TrustRecordingFailed(recorded.UnwrapErr().message));
    }

    if (decision == models::TrustDecision::Distrust) {
        spdlog::info("Device {} of {} distrusted", address.device, address.jid.ToString());
        attempt.expected_problems.Add(address.jid, address.device);
    } else {
        spdlog::info("Device {} of {} trusted", address.device, address.jid.ToString());
    }
    return std::nullopt;
}

std::optional<EncryptedSendWorkflow::SendOutcome> EncryptedSendWorkflow::Handle(
    const Attempt& attempt,
    const models::PrepareFailed& failed) {
    bool progressed = false;
    std::vector<const models::DeviceProblem*> unresolved;

    for (const auto& problem : failed.problems) {
        if (problem.kind != models::DeviceProblemKind::MissingBundle) {
            unresolved.push_back(&problem);
            continue;
        }
        if (attempt.expected_problems.Add(problem.address.jid, problem.address.device)) {
            progressed = true;
            spdlog::warn("No key bundle for device {} of {}",
                         problem.address.device, problem.address.jid.ToString());
            advisories_.Notify(attempt.session, attempt.recipient,
                               fmt::format(AdvisoryMessages::MISSING_BUNDLE,
                                           problem.address.device, problem.address.jid.ToString()));
        }
    }

    if (!unresolved.empty()) {
        const auto description = DescribeProblems(unresolved);
        spdlog::error("Cannot prepare encryption: {}", description);
        advisories_.Notify(attempt.session, attempt.recipient,
                           fmt::format(AdvisoryMessages::UNRESOLVED_PROBLEMS,
                                       attempt.recipient.ToString(), description));
        return SendOutcome::Ok(SendResult::Aborted(
            std::string(WorkflowConstants::REASON_PREPARE_FAILED), attempt.number));
    }

    if (!progressed) {
        spdlog::error("Preparation keeps failing for already excluded devices of {}",
                      attempt.recipient.ToString());
        advisories_.Notify(attempt.session, attempt.recipient,
                           fmt::format(AdvisoryMessages::NO_PROGRESS, attempt.recipient.ToString()));
        return SendOutcome::Ok(SendResult::Aborted(
            std::string(WorkflowConstants::REASON_NO_PROGRESS), attempt.number));
    }
    return std::nullopt;
}

std::optional<EncryptedSendWorkflow::SendOutcome> EncryptedSendWorkflow::Handle(
    const Attempt& attempt,
    const models::FetchError& error) {
    const auto detail = error.timed_out ? fmt::format("Request timed out: {}", error.detail) : error.detail;
    spdlog::error("Fetching recipient information failed: {}", detail);
    advisories_.Notify(attempt.session, attempt.recipient,
                       fmt::format(AdvisoryMessages::FETCH_ERROR, detail));
    return SendOutcome::Ok(SendResult::Aborted(
        std::string(WorkflowConstants::REASON_FETCH_ERROR), attempt.number));
}

std::optional<EncryptedSendWorkflow::SendOutcome> EncryptedSendWorkflow::Handle(
    const Attempt& attempt,
    const models::EncryptionError& error) {
    return Fail(attempt, WorkflowFailure::EncryptionFailed(error.detail));
}

EncryptedSendWorkflow::SendOutcome EncryptedSendWorkflow::Fail(
    const Attempt& attempt,
    WorkflowFailure failure) {
    spdlog::error("Encryption failed on attempt {}: {}", attempt.number, failure.message);
    advisories_.Notify(attempt.session, attempt.recipient,
                       fmt::format(AdvisoryMessages::ENCRYPTION_ERROR, failure.message));
    return SendOutcome::Err(std::move(failure));
}

}
