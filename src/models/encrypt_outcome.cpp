#include "omemo_send/models/encrypt_outcome.hpp"

namespace omemo_send::models {

std::string_view ToString(const DeviceProblemKind kind) noexcept {
    switch (kind) {
        case DeviceProblemKind::MissingBundle:
            return "missing bundle";
        case DeviceProblemKind::NoSession:
            return "no session";
        case DeviceProblemKind::Untrusted:
            return "untrusted";
        case DeviceProblemKind::NoEligibleDevices:
            return "no eligible devices";
        case DeviceProblemKind::Other:
            return "other";
    }
    return "other";
}

}
