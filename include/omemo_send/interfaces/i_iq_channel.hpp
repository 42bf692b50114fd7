#pragma once
#include "omemo_send/core/result.hpp"
#include "omemo_send/core/failures.hpp"
#include <chrono>
#include <string>

namespace omemo_send::interfaces {

/// Request/response channel for IQ stanzas, used by the encryption provider to
/// fetch device lists and bundles.
class IIqChannel {
public:
    virtual ~IIqChannel() = default;

    /// Sends a serialized `<iq/>` and waits for the matching `result`.
    /// The response is returned serialized. An `error` response, a timeout,
    /// or a disconnect while waiting is returned as IqFailure.
    [[nodiscard]] virtual Result<std::string, IqFailure> RoundTrip(
        const std::string& iq_xml,
        std::chrono::milliseconds timeout) = 0;
};

}
