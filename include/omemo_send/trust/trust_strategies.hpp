#pragma once
#include "omemo_send/interfaces/i_trust_decision_strategy.hpp"
#include <iosfwd>
#include <set>
#include <string>

namespace omemo_send::trust {

/// Trust on first use: every undecided device is trusted.
class AutoTrustStrategy final : public interfaces::ITrustDecisionStrategy {
public:
    [[nodiscard]] models::TrustDecision Decide(
        const models::BareJid& jid,
        models::DeviceId device,
        const models::IdentityKey& identity_key) override;
};

/// Trusts a device only if the hex fingerprint of its identity key was listed.
class AllowListTrustStrategy final : public interfaces::ITrustDecisionStrategy {
public:
    /// Fingerprints are compared case-insensitively; ':' and ' ' separators are ignored.
    explicit AllowListTrustStrategy(const std::set<std::string>& fingerprints);

    [[nodiscard]] models::TrustDecision Decide(
        const models::BareJid& jid,
        models::DeviceId device,
        const models::IdentityKey& identity_key) override;

    [[nodiscard]] static std::string NormalizeFingerprint(const std::string& fingerprint);

private:
    std::set<std::string> fingerprints_;
};

/// Asks on an interactive stream. Only "y" or "yes" trusts.
class PromptTrustStrategy final : public interfaces::ITrustDecisionStrategy {
public:
    PromptTrustStrategy(std::istream& in, std::ostream& out)
        : in_(in), out_(out) {}

    [[nodiscard]] models::TrustDecision Decide(
        const models::BareJid& jid,
        models::DeviceId device,
        const models::IdentityKey& identity_key) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

}
