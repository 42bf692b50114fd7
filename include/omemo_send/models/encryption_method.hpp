#pragma once
#include "omemo_send/core/result.hpp"
#include "omemo_send/core/failures.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace omemo_send::models {

/// Explicit Message Encryption (XEP-0380) annotation: declares which scheme
/// encrypted the message so clients without support can say so.
struct EncryptionMethod {
    std::string ns;
    std::string name;

    bool operator==(const EncryptionMethod& other) const noexcept {
        return ns == other.ns && name == other.name;
    }

    /// Mechanism name registered for a namespace, if known
    [[nodiscard]] static std::optional<std::string_view> LookupName(std::string_view ns);

    /// Annotation for a namespace; fails for namespaces outside the registry
    [[nodiscard]] static Result<EncryptionMethod, WorkflowFailure> ForNamespace(std::string_view ns);
};

}
