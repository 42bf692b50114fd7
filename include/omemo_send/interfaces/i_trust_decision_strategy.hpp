#pragma once
#include "omemo_send/models/bare_jid.hpp"
#include "omemo_send/models/device.hpp"

namespace omemo_send::interfaces {

class ITrustDecisionStrategy {
public:
    virtual ~ITrustDecisionStrategy() = default;

    [[nodiscard]] virtual models::TrustDecision Decide(
        const models::BareJid& jid,
        models::DeviceId device,
        const models::IdentityKey& identity_key) = 0;
};

}
