#pragma once
#include "omemo_send/interfaces/i_session.hpp"
#include "omemo_send/core/result.hpp"
#include "omemo_send/core/failures.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace omemo_send::test_helpers {

using interfaces::ISession;
using models::OutgoingMessage;

class MockSession : public ISession {
public:
    [[nodiscard]] Result<Unit, SessionFailure> SendPresence() override {
        ++presence_count_;
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    [[nodiscard]] Result<Unit, SessionFailure> RequestRoster() override {
        ++roster_requests_;
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    [[nodiscard]] Result<Unit, SessionFailure> SendMessage(const OutgoingMessage& message) override {
        if (!connected_) {
            return Result<Unit, SessionFailure>::Err(SessionFailure::NotConnected("mock session disconnected"));
        }
        const bool fail = message.IsEncrypted() ? fail_encrypted_sends_ : fail_plain_sends_;
        if (fail) {
            return Result<Unit, SessionFailure>::Err(SessionFailure::SendFailed("mock send failure"));
        }
        sent_.push_back(message);
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    void Disconnect() override {
        ++disconnect_calls_;
        connected_ = false;
    }

    [[nodiscard]] bool IsConnected() const override {
        return connected_;
    }

    void FailEncryptedSends() { fail_encrypted_sends_ = true; }
    void FailPlainSends() { fail_plain_sends_ = true; }

    [[nodiscard]] size_t DisconnectCalls() const noexcept { return disconnect_calls_; }
    [[nodiscard]] const std::vector<OutgoingMessage>& Sent() const noexcept { return sent_; }

    [[nodiscard]] std::vector<OutgoingMessage> EncryptedMessages() const {
        std::vector<OutgoingMessage> out;
        for (const auto& message : sent_) {
            if (message.IsEncrypted()) {
                out.push_back(message);
            }
        }
        return out;
    }

    [[nodiscard]] std::vector<std::string> Advisories() const {
        std::vector<std::string> out;
        for (const auto& message : sent_) {
            if (!message.IsEncrypted() && message.Body().has_value()) {
                out.push_back(*message.Body());
            }
        }
        return out;
    }

private:
    bool connected_ = true;
    bool fail_encrypted_sends_ = false;
    bool fail_plain_sends_ = false;
    size_t presence_count_ = 0;
    size_t roster_requests_ = 0;
    size_t disconnect_calls_ = 0;
    std::vector<OutgoingMessage> sent_;
};

}
