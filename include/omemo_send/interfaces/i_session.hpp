#pragma once
#include "omemo_send/core/result.hpp"
#include "omemo_send/core/failures.hpp"
#include "omemo_send/models/outgoing_message.hpp"

namespace omemo_send::interfaces {

/// Logged-in messaging session. Owns the connection; the send workflow only
/// dispatches stanzas and terminates it.
class ISession {
public:
    virtual ~ISession() = default;

    [[nodiscard]] virtual Result<Unit, SessionFailure> SendPresence() = 0;

    [[nodiscard]] virtual Result<Unit, SessionFailure> RequestRoster() = 0;

    [[nodiscard]] virtual Result<Unit, SessionFailure> SendMessage(
        const models::OutgoingMessage& message) = 0;

    /// Idempotent
    virtual void Disconnect() = 0;

    [[nodiscard]] virtual bool IsConnected() const = 0;
};

}
