#pragma once
#include "omemo_send/interfaces/i_session.hpp"
#include "omemo_send/models/bare_jid.hpp"
#include <string>

namespace omemo_send::workflow {

/// Sends unencrypted notices about encryption problems to the recipient.
/// Best effort: a failed send is logged and otherwise ignored.
class PlainAdvisorySender {
public:
    void Notify(interfaces::ISession& session,
                const models::BareJid& recipient,
                const std::string& text) const;
};

}
