#include "omemo_send/models/expected_problems.hpp"
#include <algorithm>

namespace omemo_send::models {

bool ExpectedProblems::Add(const BareJid& jid, const DeviceId device) {
    auto& devices = entries_[jid];
    if (std::find(devices.begin(), devices.end(), device) != devices.end()) {
        return false;
    }
    devices.push_back(device);
    return true;
}

bool ExpectedProblems::Contains(const BareJid& jid, const DeviceId device) const {
    const auto it = entries_.find(jid);
    if (it == entries_.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), device) != it->second.end();
}

const std::vector<DeviceId>& ExpectedProblems::DevicesFor(const BareJid& jid) const {
    static const std::vector<DeviceId> empty;
    const auto it = entries_.find(jid);
    return it == entries_.end() ? empty : it->second;
}

size_t ExpectedProblems::Size() const noexcept {
    size_t total = 0;
    for (const auto& [jid, devices] : entries_) {
        total += devices.size();
    }
    return total;
}

}
