#include "omemo_send/plugin/plugin_encryption_provider.hpp"
#include "omemo_send/crypto/sodium_interop.hpp"
#include "provider/encryption_exchange.pb.h"

#include <dlfcn.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <climits>

namespace omemo_send::plugin {

using crypto::SodiumInterop;
using namespace omemo_send::proto::provider;

namespace {

using LoadResult = Result<std::unique_ptr<PluginEncryptionProvider>, PluginFailure>;

template<typename Fn>
Result<Fn, PluginFailure> ResolveSymbol(void* library, const char* name) {
    dlerror();
    void* symbol = dlsym(library, name);
    if (const char* error = dlerror(); error != nullptr || symbol == nullptr) {
        return Result<Fn, PluginFailure>::Err(PluginFailure::MissingSymbol(
            fmt::format("{}: {}", name, error != nullptr ? error : "null symbol")));
    }
    return Result<Fn, PluginFailure>::Ok(reinterpret_cast<Fn>(symbol));
}

models::DeviceProblemKind FromProto(const DeviceProblemKind kind) {
    switch (kind) {
        case DEVICE_PROBLEM_KIND_MISSING_BUNDLE:
            return models::DeviceProblemKind::MissingBundle;
        case DEVICE_PROBLEM_KIND_NO_SESSION:
            return models::DeviceProblemKind::NoSession;
        case DEVICE_PROBLEM_KIND_UNTRUSTED:
            return models::DeviceProblemKind::Untrusted;
        case DEVICE_PROBLEM_KIND_NO_ELIGIBLE_DEVICES:
            return models::DeviceProblemKind::NoEligibleDevices;
        default:
            return models::DeviceProblemKind::Other;
    }
}

Result<models::DeviceAddress, WorkflowFailure> FromProto(const DeviceAddress& address) {
    return models::BareJid::Parse(address.jid()).Map([&address](models::BareJid jid) {
        return models::DeviceAddress{std::move(jid), address.device_id()};
    });
}

models::EncryptOutcome FromProto(const EncryptResponse& response) {
    switch (response.outcome_case()) {
        case EncryptResponse::kEncrypted:
            return models::EncryptedEnvelope(response.encrypted().xml());

        case EncryptResponse::kTrustUndecided: {
            const auto& undecided = response.trust_undecided();
            auto address = FromProto(undecided.address());
            if (address.IsErr()) {
                return models::EncryptionError{
                    "provider reported an undecided device with an invalid address: " +
                    address.UnwrapErr().message};
            }
            return models::TrustUndecided{
                std::move(address).Unwrap(),
                models::IdentityKey(undecided.identity_key().begin(), undecided.identity_key().end())};
        }

        case EncryptResponse::kPrepareFailed: {
            models::PrepareFailed failed;
            failed.problems.reserve(response.prepare_failed().problems_size());
            for (const auto& problem : response.prepare_failed().problems()) {
                auto address = FromProto(problem.address());
                if (address.IsErr()) {
                    return models::EncryptionError{
                        "provider reported a device problem with an invalid address: " +
                        address.UnwrapErr().message};
                }
                failed.problems.push_back(models::DeviceProblem{
                    FromProto(problem.kind()), std::move(address).Unwrap(), problem.detail()});
            }
            return failed;
        }

        case EncryptResponse::kFetchError:
            return models::FetchError{response.fetch_error().timed_out(), response.fetch_error().detail()};

        case EncryptResponse::kEncryptionError:
            return models::EncryptionError{response.encryption_error().detail()};

        case EncryptResponse::OUTCOME_NOT_SET:
            break;
    }
    return models::EncryptionError{"provider returned an empty response"};
}

OspIqStatus ToIqStatus(const IqFailureType type) {
    switch (type) {
        case IqFailureType::Error:
            return OSP_IQ_ERROR;
        case IqFailureType::Timeout:
            return OSP_IQ_TIMEOUT;
        case IqFailureType::Disconnected:
            return OSP_IQ_DISCONNECTED;
        case IqFailureType::InvalidRequest:
            return OSP_IQ_INVALID_REQUEST;
    }
    return OSP_IQ_ERROR;
}

void WipeRequest(std::string& serialized) {
    if (const auto wiped = SodiumInterop::SecureWipe(serialized); wiped.IsErr()) {
        spdlog::warn("Could not wipe encryption request: {}", wiped.UnwrapErr().message);
    }
}

}

void PluginEncryptionProvider::LibraryCloser::operator()(void* library) const noexcept {
    if (library != nullptr && dlclose(library) != 0) {
        const char* error = dlerror();
        spdlog::warn("Could not unload provider plugin: {}", error != nullptr ? error : "unknown error");
    }
}

Result<PluginEncryptionProvider::Symbols, PluginFailure> PluginEncryptionProvider::ResolveSymbols(
    void* library) {
    using SymbolsResult = Result<Symbols, PluginFailure>;
    Symbols symbols;

#define OMEMO_SEND_RESOLVE(field, name) \
    do { \
        auto resolved = ResolveSymbol<name##_fn>(library, #name); \
        if (resolved.IsErr()) { \
            return SymbolsResult::Err(std::move(resolved).UnwrapErr()); \
        } \
        symbols.field = resolved.Unwrap(); \
    } while (0)

    OMEMO_SEND_RESOLVE(abi_version, osp_plugin_abi_version);
    OMEMO_SEND_RESOLVE(encryption_namespace, osp_plugin_encryption_namespace);
    OMEMO_SEND_RESOLVE(create, osp_provider_create);
    OMEMO_SEND_RESOLVE(destroy, osp_provider_destroy);
    OMEMO_SEND_RESOLVE(encrypt, osp_provider_encrypt);
    OMEMO_SEND_RESOLVE(set_trust, osp_provider_set_trust);
    OMEMO_SEND_RESOLVE(buffer_free, osp_buffer_free);
    OMEMO_SEND_RESOLVE(error_free, osp_error_free);

#undef OMEMO_SEND_RESOLVE

    return SymbolsResult::Ok(symbols);
}

LoadResult PluginEncryptionProvider::Load(
    const std::filesystem::path& plugin_path,
    const std::filesystem::path& data_dir,
    const models::BareJid& own_jid,
    interfaces::IIqChannel& iq_channel,
    const std::chrono::milliseconds iq_timeout) {
    spdlog::debug("Loading provider plugin {}", plugin_path.string());

    LibraryHandle library(dlopen(plugin_path.c_str(), RTLD_NOW | RTLD_LOCAL));
    if (!library) {
        const char* error = dlerror();
        return LoadResult::Err(PluginFailure::CouldNotLoad(
            fmt::format("{}: {}", plugin_path.string(), error != nullptr ? error : "unknown error")));
    }

    auto symbols = ResolveSymbols(library.get());
    if (symbols.IsErr()) {
        return LoadResult::Err(std::move(symbols).UnwrapErr());
    }
    const auto& resolved = symbols.Unwrap();

    if (const auto version = resolved.abi_version(); version != OSP_PLUGIN_ABI_VERSION) {
        return LoadResult::Err(PluginFailure::AbiMismatch(fmt::format(
            "plugin implements ABI version {}, expected {}", version, OSP_PLUGIN_ABI_VERSION)));
    }

    const char* encryption_namespace = resolved.encryption_namespace();
    if (encryption_namespace == nullptr || *encryption_namespace == '\0') {
        return LoadResult::Err(PluginFailure::InitFailed("plugin declares no encryption namespace"));
    }

    std::unique_ptr<PluginEncryptionProvider> provider(new PluginEncryptionProvider(
        std::move(library), resolved, encryption_namespace, own_jid.ToString(), iq_channel, iq_timeout));

    const auto data_dir_string = data_dir.string();
    OspError error{OSP_SUCCESS, nullptr};
    const auto code = provider->symbols_.create(
        data_dir_string.c_str(), &provider->host_services_, &provider->handle_, &error);
    if (code != OSP_SUCCESS || provider->handle_ == nullptr) {
        provider->handle_ = nullptr;
        return LoadResult::Err(PluginFailure::InitFailed(provider->TakeErrorMessage(code, error)));
    }

    spdlog::info("Loaded provider plugin for {}", provider->encryption_namespace_);
    return LoadResult::Ok(std::move(provider));
}

PluginEncryptionProvider::PluginEncryptionProvider(
    LibraryHandle library,
    const Symbols& symbols,
    std::string encryption_namespace,
    std::string own_jid,
    interfaces::IIqChannel& iq_channel,
    const std::chrono::milliseconds iq_timeout)
    : library_(std::move(library))
    , symbols_(symbols)
    , encryption_namespace_(std::move(encryption_namespace))
    , own_jid_(std::move(own_jid))
    , iq_channel_(iq_channel)
    , iq_timeout_(iq_timeout) {
    host_services_.iq_round_trip = &PluginEncryptionProvider::IqRoundTrip;
    host_services_.host_data = this;
    host_services_.own_jid = own_jid_.c_str();
}

PluginEncryptionProvider::~PluginEncryptionProvider() {
    if (handle_ != nullptr) {
        symbols_.destroy(handle_);
        handle_ = nullptr;
    }
}

std::string PluginEncryptionProvider::TakeErrorMessage(const OspErrorCode code, OspError& error) const {
    std::string message = error.message != nullptr
        ? std::string(error.message)
        : fmt::format("provider call failed with code {}", static_cast<int>(code));
    symbols_.error_free(&error);
    return message;
}

models::EncryptOutcome PluginEncryptionProvider::Encrypt(
    const std::string& plaintext,
    const std::vector<models::BareJid>& recipients,
    const models::ExpectedProblems& expected_problems) {
    EncryptRequest request;
    request.set_plaintext(plaintext);
    for (const auto& recipient : recipients) {
        request.add_recipients(recipient.ToString());
    }
    for (const auto& [jid, devices] : expected_problems.Entries()) {
        auto* expected = request.add_expected_problems();
        expected->set_jid(jid.ToString());
        for (const auto device : devices) {
            expected->add_device_ids(device);
        }
    }

    std::string serialized;
    const bool encoded = request.SerializeToString(&serialized);
    WipeRequest(*request.mutable_plaintext());
    if (!encoded) {
        return models::EncryptionError{"could not encode encryption request"};
    }

    OspBuffer response{nullptr, 0};
    OspError error{OSP_SUCCESS, nullptr};
    const auto code = symbols_.encrypt(
        handle_,
        reinterpret_cast<const uint8_t*>(serialized.data()),
        serialized.size(),
        &response,
        &error);
    WipeRequest(serialized);
    if (code != OSP_SUCCESS) {
        return models::EncryptionError{TakeErrorMessage(code, error)};
    }

    EncryptResponse decoded;
    const bool parsed = response.length <= static_cast<size_t>(INT_MAX) &&
                        decoded.ParseFromArray(response.data, static_cast<int>(response.length));
    symbols_.buffer_free(&response);
    if (!parsed) {
        return models::EncryptionError{"could not decode encryption response"};
    }
    return FromProto(decoded);
}

Result<Unit, WorkflowFailure> PluginEncryptionProvider::RecordTrust(
    const models::DeviceAddress& address,
    const models::IdentityKey& identity_key,
    const models::TrustDecision decision) {
    TrustRequest request;
    request.mutable_address()->set_jid(address.jid.ToString());
    request.mutable_address()->set_device_id(address.device);
    request.set_identity_key(identity_key.data(), identity_key.size());
    request.set_level(decision == models::TrustDecision::Trust ? TRUST_LEVEL_TRUSTED : TRUST_LEVEL_DISTRUSTED);

    std::string serialized;
    if (!request.SerializeToString(&serialized)) {
        return Result<Unit, WorkflowFailure>::Err(
            WorkflowFailure::TrustRecordingFailed("could not encode trust request"));
    }

    OspError error{OSP_SUCCESS, nullptr};
    const auto code = symbols_.set_trust(
        handle_,
        reinterpret_cast<const uint8_t*>(serialized.data()),
        serialized.size(),
        &error);
    if (code != OSP_SUCCESS) {
        return Result<Unit, WorkflowFailure>::Err(
            WorkflowFailure::TrustRecordingFailed(TakeErrorMessage(code, error)));
    }
    return Result<Unit, WorkflowFailure>::Ok(Unit{});
}

OspIqStatus PluginEncryptionProvider::IqRoundTrip(
    void* host_data,
    const char* iq_xml,
    const size_t iq_xml_length,
    const uint32_t timeout_ms,
    const OspIqResponseSink sink,
    void* sink_data) {
    if (host_data == nullptr || iq_xml == nullptr || sink == nullptr) {
        return OSP_IQ_INVALID_REQUEST;
    }
    auto* self = static_cast<PluginEncryptionProvider*>(host_data);
    const auto timeout = timeout_ms == 0 ? self->iq_timeout_ : std::chrono::milliseconds(timeout_ms);

    // Exceptions must not unwind into the plugin.
    try {
        auto response = self->iq_channel_.RoundTrip(std::string(iq_xml, iq_xml_length), timeout);
        if (response.IsErr()) {
            const auto& failure = response.UnwrapErr();
            spdlog::debug("Provider IQ failed: {}", failure.message);
            sink(failure.message.data(), failure.message.size(), sink_data);
            return ToIqStatus(failure.type);
        }
        const auto& stanza = response.Unwrap();
        sink(stanza.data(), stanza.size(), sink_data);
        return OSP_IQ_RESULT;
    } catch (const std::exception& ex) {
        spdlog::error("Provider IQ round trip failed: {}", ex.what());
        return OSP_IQ_INVALID_REQUEST;
    }
}

}
