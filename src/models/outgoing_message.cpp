#include "omemo_send/models/outgoing_message.hpp"
#include "omemo_send/core/constants.hpp"

namespace omemo_send::models {

OutgoingMessage OutgoingMessage::Chat(BareJid to) {
    return OutgoingMessage(std::move(to), std::string(StanzaConstants::MESSAGE_TYPE_CHAT));
}

OutgoingMessage OutgoingMessage::PlainChat(BareJid to, std::string body) {
    auto message = Chat(std::move(to));
    message.body_ = std::move(body);
    return message;
}

void OutgoingMessage::SetEncryptionMethod(EncryptionMethod method) {
    method_ = std::move(method);
}

void OutgoingMessage::AttachEnvelope(EncryptedEnvelope envelope) {
    envelopes_.push_back(std::move(envelope));
}

}
