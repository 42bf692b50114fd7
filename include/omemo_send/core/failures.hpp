#pragma once
#include <string>
#include <string_view>
namespace omemo_send {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge
};
enum class SessionFailureType {
    NotConnected,
    ConnectFailed,
    SendFailed,
    InvalidStanza
};
enum class IqFailureType {
    Error,
    Timeout,
    Disconnected,
    InvalidRequest
};
enum class PluginFailureType {
    CouldNotLoad,
    MissingSymbol,
    AbiMismatch,
    InitFailed
};
enum class ConfigFailureType {
    HelpRequested,
    UnknownOption,
    MissingValue,
    InvalidValue,
    DataDirectory
};
enum class WorkflowFailureType {
    InvalidInput,
    EncryptionFailed,
    TrustRecordingFailed,
    DispatchFailed
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
};
class SessionFailure {
public:
    SessionFailureType type;
    std::string message;
    SessionFailure(const SessionFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SessionFailure NotConnected(std::string msg) {
        return {SessionFailureType::NotConnected, std::move(msg)};
    }
    static SessionFailure ConnectFailed(std::string msg) {
        return {SessionFailureType::ConnectFailed, std::move(msg)};
    }
    static SessionFailure SendFailed(std::string msg) {
        return {SessionFailureType::SendFailed, std::move(msg)};
    }
    static SessionFailure InvalidStanza(std::string msg) {
        return {SessionFailureType::InvalidStanza, std::move(msg)};
    }
};
/// Failure of an IQ request/response round trip. For `Error` the message
/// carries the stanza error condition (e.g. "item-not-found").
class IqFailure {
public:
    IqFailureType type;
    std::string message;
    IqFailure(const IqFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static IqFailure Error(std::string condition) {
        return {IqFailureType::Error, std::move(condition)};
    }
    static IqFailure Timeout(std::string msg) {
        return {IqFailureType::Timeout, std::move(msg)};
    }
    static IqFailure Disconnected(std::string msg) {
        return {IqFailureType::Disconnected, std::move(msg)};
    }
    static IqFailure InvalidRequest(std::string msg) {
        return {IqFailureType::InvalidRequest, std::move(msg)};
    }
};
class PluginFailure {
public:
    PluginFailureType type;
    std::string message;
    PluginFailure(const PluginFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static PluginFailure CouldNotLoad(std::string msg) {
        return {PluginFailureType::CouldNotLoad, std::move(msg)};
    }
    static PluginFailure MissingSymbol(std::string msg) {
        return {PluginFailureType::MissingSymbol, std::move(msg)};
    }
    static PluginFailure AbiMismatch(std::string msg) {
        return {PluginFailureType::AbiMismatch, std::move(msg)};
    }
    static PluginFailure InitFailed(std::string msg) {
        return {PluginFailureType::InitFailed, std::move(msg)};
    }
};
class ConfigFailure {
public:
    ConfigFailureType type;
    std::string message;
    ConfigFailure(const ConfigFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ConfigFailure HelpRequested() {
        return {ConfigFailureType::HelpRequested, "help requested"};
    }
    static ConfigFailure UnknownOption(std::string msg) {
        return {ConfigFailureType::UnknownOption, std::move(msg)};
    }
    static ConfigFailure MissingValue(std::string msg) {
        return {ConfigFailureType::MissingValue, std::move(msg)};
    }
    static ConfigFailure InvalidValue(std::string msg) {
        return {ConfigFailureType::InvalidValue, std::move(msg)};
    }
    static ConfigFailure DataDirectory(std::string msg) {
        return {ConfigFailureType::DataDirectory, std::move(msg)};
    }
};
class WorkflowFailure {
public:
    WorkflowFailureType type;
    std::string message;
    WorkflowFailure(const WorkflowFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static WorkflowFailure InvalidInput(std::string msg) {
        return {WorkflowFailureType::InvalidInput, std::move(msg)};
    }
    static WorkflowFailure EncryptionFailed(std::string msg) {
        return {WorkflowFailureType::EncryptionFailed, std::move(msg)};
    }
    static WorkflowFailure TrustRecordingFailed(std::string msg) {
        return {WorkflowFailureType::TrustRecordingFailed, std::move(msg)};
    }
    static WorkflowFailure DispatchFailed(std::string msg) {
        return {WorkflowFailureType::DispatchFailed, std::move(msg)};
    }
    static WorkflowFailure FromSessionFailure(const SessionFailure& sf) {
        return DispatchFailed(sf.message);
    }
};
}
