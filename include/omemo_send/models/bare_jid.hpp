#pragma once
#include "omemo_send/core/result.hpp"
#include "omemo_send/core/failures.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace omemo_send::models {

/// Recipient identity without a resource suffix: `local@domain` or `domain`.
///
/// Parsing strips a `/resource`, lower-cases ASCII in both parts, and rejects
/// whitespace, an empty local part before `@`, a second `@`, and an empty
/// domain.
class BareJid {
public:
    [[nodiscard]] static Result<BareJid, WorkflowFailure> Parse(std::string_view text);

    [[nodiscard]] const std::string& Local() const noexcept { return local_; }
    [[nodiscard]] const std::string& Domain() const noexcept { return domain_; }
    [[nodiscard]] std::string ToString() const;

    bool operator==(const BareJid& other) const noexcept {
        return local_ == other.local_ && domain_ == other.domain_;
    }
    bool operator!=(const BareJid& other) const noexcept { return !(*this == other); }
    bool operator<(const BareJid& other) const noexcept {
        return local_ != other.local_ ? local_ < other.local_ : domain_ < other.domain_;
    }

    static constexpr size_t MAX_PART_LENGTH = 1023;

private:
    BareJid(std::string local, std::string domain)
        : local_(std::move(local)), domain_(std::move(domain)) {}

    std::string local_;
    std::string domain_;
};

}
