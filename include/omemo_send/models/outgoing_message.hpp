#pragma once
#include "omemo_send/models/bare_jid.hpp"
#include "omemo_send/models/encrypted_envelope.hpp"
#include "omemo_send/models/encryption_method.hpp"
#include <optional>
#include <string>
#include <vector>

namespace omemo_send::models {

/// Chat message stanza shell. Sessions serialize it to the wire format.
class OutgoingMessage {
public:
    [[nodiscard]] static OutgoingMessage Chat(BareJid to);

    [[nodiscard]] static OutgoingMessage PlainChat(BareJid to, std::string body);

    void SetEncryptionMethod(EncryptionMethod method);

    void AttachEnvelope(EncryptedEnvelope envelope);

    [[nodiscard]] const BareJid& To() const noexcept { return to_; }
    [[nodiscard]] const std::string& Type() const noexcept { return type_; }
    [[nodiscard]] const std::optional<std::string>& Body() const noexcept { return body_; }
    [[nodiscard]] const std::optional<EncryptionMethod>& Method() const noexcept { return method_; }
    [[nodiscard]] const std::vector<EncryptedEnvelope>& Envelopes() const noexcept { return envelopes_; }
    [[nodiscard]] bool IsEncrypted() const noexcept { return !envelopes_.empty(); }

private:
    OutgoingMessage(BareJid to, std::string type)
        : to_(std::move(to)), type_(std::move(type)) {}

    BareJid to_;
    std::string type_;
    std::optional<std::string> body_;
    std::optional<EncryptionMethod> method_;
    std::vector<EncryptedEnvelope> envelopes_;
};

}
