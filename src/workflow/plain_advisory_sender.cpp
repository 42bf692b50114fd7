#include "omemo_send/workflow/plain_advisory_sender.hpp"
#include <spdlog/spdlog.h>

namespace omemo_send::workflow {

void PlainAdvisorySender::Notify(
    interfaces::ISession& session,
    const models::BareJid& recipient,
    const std::string& text) const {
    spdlog::debug("Advisory to {}: {}", recipient.ToString(), text);
    const auto result = session.SendMessage(models::OutgoingMessage::PlainChat(recipient, text));
    if (result.IsErr()) {
        spdlog::warn("Could not deliver advisory to {}: {}",
                     recipient.ToString(), result.UnwrapErr().message);
    }
}

}
