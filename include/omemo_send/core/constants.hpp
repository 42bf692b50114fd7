#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace omemo_send {
struct XmppNamespaces {
    static constexpr std::string_view EME = "urn:xmpp:eme:0";
    static constexpr std::string_view PING = "urn:xmpp:ping";
    static constexpr std::string_view DISCO_INFO = "http://jabber.org/protocol/disco#info";
    static constexpr std::string_view ROSTER = "jabber:iq:roster";
    static constexpr std::string_view STANZAS = "urn:ietf:params:xml:ns:xmpp-stanzas";
    static constexpr std::string_view OMEMO_LEGACY = "eu.siacs.conversations.axolotl";
    static constexpr std::string_view OMEMO_LEGACY_DEVICELIST_NOTIFY =
        "eu.siacs.conversations.axolotl.devicelist+notify";
};
struct StanzaConstants {
    static constexpr std::string_view MESSAGE_TYPE_CHAT = "chat";
    static constexpr std::string_view IQ_TYPE_GET = "get";
    static constexpr std::string_view IQ_TYPE_SET = "set";
    static constexpr std::string_view IQ_TYPE_RESULT = "result";
    static constexpr std::string_view IQ_TYPE_ERROR = "error";
    static constexpr std::string_view RESOURCE_PREFIX = "omemo-send.";
    static constexpr size_t RESOURCE_SUFFIX_LENGTH = 8;
    static constexpr std::string_view DISCO_IDENTITY_CATEGORY = "client";
    static constexpr std::string_view DISCO_IDENTITY_TYPE = "console";
    static constexpr std::string_view DISCO_IDENTITY_NAME = "omemo-send";
};
struct WorkflowConstants {
    // Each attempt that does not end the run settles one device, so this also
    // caps the devices a recipient may have.
    static constexpr uint32_t DEFAULT_MAX_ATTEMPTS = 512;
    static constexpr uint32_t MINIMUM_MAX_ATTEMPTS = 1;
    static constexpr std::chrono::milliseconds DEFAULT_IQ_TIMEOUT{10'000};
    static constexpr std::chrono::milliseconds LOOP_POLL_INTERVAL{50};
    static constexpr std::string_view REASON_FETCH_ERROR = "fetch-error";
    static constexpr std::string_view REASON_PREPARE_FAILED = "prepare-failed";
    static constexpr std::string_view REASON_NO_PROGRESS = "no-progress";
    static constexpr std::string_view REASON_TRUST_NOT_APPLIED = "trust-not-applied";
    static constexpr std::string_view REASON_RETRY_LIMIT = "retry-limit";
};
struct AdvisoryMessages {
    static constexpr std::string_view MISSING_BUNDLE =
        "Could not find keys for device \"{}\" of recipient \"{}\". Skipping.";
    static constexpr std::string_view FETCH_ERROR =
        "An error occurred while fetching information on a recipient.\n{}";
    static constexpr std::string_view ENCRYPTION_ERROR =
        "An error occurred while attempting to encrypt.\n{}";
    static constexpr std::string_view UNRESOLVED_PROBLEMS =
        "Could not prepare encryption for recipient \"{}\": {}";
    static constexpr std::string_view NO_PROGRESS =
        "Encryption for recipient \"{}\" keeps failing for devices that were already skipped.";
    static constexpr std::string_view TRUST_NOT_APPLIED =
        "The trust decision for device \"{}\" of recipient \"{}\" was not applied.";
    static constexpr std::string_view RETRY_LIMIT =
        "Giving up on encrypting for recipient \"{}\" after {} attempts.";
};
struct ExitCodes {
    static constexpr int SUCCESS = 0;
    static constexpr int PLUGIN_LOAD_FAILED = 1;
    static constexpr int USAGE = 2;
    static constexpr int CONNECTION_FAILED = 3;
    static constexpr int WORKFLOW_FAILED = 4;
};
struct EnvironmentVariables {
    static constexpr const char* JID = "OMEMO_SEND_JID";
    static constexpr const char* PASSWORD = "OMEMO_SEND_PASSWORD";
    static constexpr const char* PLUGIN = "OMEMO_SEND_PLUGIN";
};
}
