#pragma once
#include <cstdint>
#include <string>

namespace omemo_send::models {

enum class SendStatus : uint8_t {
    Sent,
    Aborted
};

struct SendResult {
    SendStatus status;
    std::string reason;
    uint32_t attempts = 0;

    [[nodiscard]] static SendResult Sent(const uint32_t attempts) {
        return {SendStatus::Sent, {}, attempts};
    }
    [[nodiscard]] static SendResult Aborted(std::string reason, const uint32_t attempts) {
        return {SendStatus::Aborted, std::move(reason), attempts};
    }
    [[nodiscard]] bool IsSent() const noexcept { return status == SendStatus::Sent; }
};

}
