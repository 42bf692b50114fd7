#include "omemo_send/models/encryption_method.hpp"
#include "omemo_send/core/constants.hpp"
#include <fmt/core.h>
#include <array>
#include <utility>

namespace omemo_send::models {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kMechanisms{{
    {"urn:xmpp:otr:0", "OTR"},
    {"jabber:x:encrypted", "Legacy OpenPGP"},
    {"urn:xmpp:openpgp:0", "OpenPGP for XMPP"},
    {XmppNamespaces::OMEMO_LEGACY, "OMEMO"},
    {"urn:xmpp:omemo:1", "OMEMO"},
    {"urn:xmpp:omemo:2", "OMEMO"},
}};

}

std::optional<std::string_view> EncryptionMethod::LookupName(const std::string_view ns) {
    for (const auto& [known_ns, name] : kMechanisms) {
        if (known_ns == ns) {
            return name;
        }
    }
    return std::nullopt;
}

Result<EncryptionMethod, WorkflowFailure> EncryptionMethod::ForNamespace(const std::string_view ns) {
    const auto name = LookupName(ns);
    if (!name.has_value()) {
        return Result<EncryptionMethod, WorkflowFailure>::Err(
            WorkflowFailure::InvalidInput(
                fmt::format("No encryption mechanism registered for namespace '{}'", ns)));
    }
    return Result<EncryptionMethod, WorkflowFailure>::Ok(
        EncryptionMethod{std::string(ns), std::string(*name)});
}

}
