#pragma once
#include "omemo_send/models/bare_jid.hpp"
#include <cstdint>
#include <vector>

namespace omemo_send::models {

using DeviceId = uint32_t;
using IdentityKey = std::vector<uint8_t>;

struct DeviceAddress {
    BareJid jid;
    DeviceId device;

    bool operator==(const DeviceAddress& other) const noexcept {
        return device == other.device && jid == other.jid;
    }
    bool operator<(const DeviceAddress& other) const noexcept {
        return jid != other.jid ? jid < other.jid : device < other.device;
    }
};

enum class TrustDecision : uint8_t {
    Trust,
    Distrust
};

}
