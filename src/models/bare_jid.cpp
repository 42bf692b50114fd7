#include "omemo_send/models/bare_jid.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cctype>

namespace omemo_send::models {

namespace {

std::string ToLowerAscii(std::string_view input) {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool ContainsWhitespace(std::string_view input) {
    return std::any_of(input.begin(), input.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
}

}

Result<BareJid, WorkflowFailure> BareJid::Parse(std::string_view text) {
    using ResultType = Result<BareJid, WorkflowFailure>;
    if (text.empty()) {
        return ResultType::Err(WorkflowFailure::InvalidInput("Address is empty"));
    }
    if (ContainsWhitespace(text)) {
        return ResultType::Err(WorkflowFailure::InvalidInput(
            fmt::format("Address '{}' contains whitespace", text)));
    }

    std::string_view bare = text.substr(0, text.find('/'));
    const auto at = bare.find('@');
    std::string_view local;
    std::string_view domain = bare;
    if (at != std::string_view::npos) {
        local = bare.substr(0, at);
        domain = bare.substr(at + 1);
        if (local.empty()) {
            return ResultType::Err(WorkflowFailure::InvalidInput(
                fmt::format("Address '{}' has an empty local part", text)));
        }
        if (domain.find('@') != std::string_view::npos) {
            return ResultType::Err(WorkflowFailure::InvalidInput(
                fmt::format("Address '{}' contains more than one '@'", text)));
        }
    }
    if (domain.empty()) {
        return ResultType::Err(WorkflowFailure::InvalidInput(
            fmt::format("Address '{}' has an empty domain", text)));
    }
    if (local.size() > MAX_PART_LENGTH || domain.size() > MAX_PART_LENGTH) {
        return ResultType::Err(WorkflowFailure::InvalidInput(
            fmt::format("Address '{}' exceeds {} bytes per part", text, MAX_PART_LENGTH)));
    }

    return ResultType::Ok(BareJid(ToLowerAscii(local), ToLowerAscii(domain)));
}

std::string BareJid::ToString() const {
    if (local_.empty()) {
        return domain_;
    }
    return local_ + "@" + domain_;
}

}
