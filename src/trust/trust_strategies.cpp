#include "omemo_send/trust/trust_strategies.hpp"
#include "omemo_send/crypto/sodium_interop.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace omemo_send::trust {

using models::TrustDecision;

TrustDecision AutoTrustStrategy::Decide(
    const models::BareJid& jid,
    const models::DeviceId device,
    const models::IdentityKey&) {
    spdlog::info("Trusting undecided device {} of {}", device, jid.ToString());
    return TrustDecision::Trust;
}

AllowListTrustStrategy::AllowListTrustStrategy(const std::set<std::string>& fingerprints) {
    for (const auto& fingerprint : fingerprints) {
        fingerprints_.insert(NormalizeFingerprint(fingerprint));
    }
}

std::string AllowListTrustStrategy::NormalizeFingerprint(const std::string& fingerprint) {
    std::string normalized;
    normalized.reserve(fingerprint.size());
    for (const unsigned char c : fingerprint) {
        if (c == ':' || std::isspace(c)) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(c)));
    }
    return normalized;
}

TrustDecision AllowListTrustStrategy::Decide(
    const models::BareJid& jid,
    const models::DeviceId device,
    const models::IdentityKey& identity_key) {
    const auto fingerprint = crypto::SodiumInterop::ToHex(identity_key);
    if (fingerprints_.contains(fingerprint)) {
        spdlog::info("Device {} of {} is on the allow list", device, jid.ToString());
        return TrustDecision::Trust;
    }
    spdlog::warn("Device {} of {} with fingerprint {} is not on the allow list",
                 device, jid.ToString(), fingerprint);
    return TrustDecision::Distrust;
}

TrustDecision PromptTrustStrategy::Decide(
    const models::BareJid& jid,
    const models::DeviceId device,
    const models::IdentityKey& identity_key) {
    out_ << fmt::format("Fingerprint of device {} of {}: {}\n",
                        device, jid.ToString(), crypto::SodiumInterop::ToHex(identity_key));
    out_ << fmt::format("Trust device {} of {} [y/N]? ", device, jid.ToString());
    out_.flush();

    std::string answer;
    if (!std::getline(in_, answer)) {
        return TrustDecision::Distrust;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return (answer == "y" || answer == "yes") ? TrustDecision::Trust : TrustDecision::Distrust;
}

}
