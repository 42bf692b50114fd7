#pragma once
#include "omemo_send/models/bare_jid.hpp"
#include "omemo_send/models/device.hpp"
#include <cstddef>
#include <map>
#include <vector>

namespace omemo_send::models {

/// Devices to skip on the next encryption attempt, keyed by recipient.
///
/// Owned by one workflow invocation. Device lists keep insertion order and
/// never hold the same device twice.
class ExpectedProblems {
public:
    /// @return true if the device was not excluded before
    bool Add(const BareJid& jid, DeviceId device);

    [[nodiscard]] bool Contains(const BareJid& jid, DeviceId device) const;

    [[nodiscard]] const std::vector<DeviceId>& DevicesFor(const BareJid& jid) const;

    /// Total number of excluded devices over all recipients
    [[nodiscard]] size_t Size() const noexcept;

    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const std::map<BareJid, std::vector<DeviceId>>& Entries() const noexcept {
        return entries_;
    }

private:
    std::map<BareJid, std::vector<DeviceId>> entries_;
};

}
