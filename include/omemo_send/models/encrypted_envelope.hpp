#pragma once
#include <string>

namespace omemo_send::models {

/// Encrypted payload element produced by the encryption provider, carried as
/// serialized XML. The workflow attaches it to a stanza without inspecting it.
class EncryptedEnvelope {
public:
    explicit EncryptedEnvelope(std::string xml) : xml_(std::move(xml)) {}

    [[nodiscard]] const std::string& Xml() const noexcept { return xml_; }

private:
    std::string xml_;
};

}
