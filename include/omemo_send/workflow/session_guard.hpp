#pragma once
#include "omemo_send/interfaces/i_session.hpp"

namespace omemo_send::workflow {

/// Disconnects the session exactly once, when released or destroyed,
/// whichever comes first.
class SessionGuard {
public:
    explicit SessionGuard(interfaces::ISession& session) noexcept
        : session_(&session) {}

    ~SessionGuard() {
        Release();
    }

    void Release() {
        if (session_ != nullptr) {
            auto* session = session_;
            session_ = nullptr;
            session->Disconnect();
        }
    }

    [[nodiscard]] bool IsArmed() const noexcept { return session_ != nullptr; }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;
    SessionGuard(SessionGuard&&) = delete;
    SessionGuard& operator=(SessionGuard&&) = delete;

private:
    interfaces::ISession* session_;
};

}
