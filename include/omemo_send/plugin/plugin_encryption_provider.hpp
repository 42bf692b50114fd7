#pragma once
#include "omemo_send/c_api/osp_provider_api.h"
#include "omemo_send/core/failures.hpp"
#include "omemo_send/core/result.hpp"
#include "omemo_send/interfaces/i_encryption_provider.hpp"
#include "omemo_send/interfaces/i_iq_channel.hpp"
#include "omemo_send/models/bare_jid.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace omemo_send::plugin {

/**
 * @brief Encryption provider backed by an OMEMO provider shared library
 *
 * Loads a plugin implementing the osp_* C ABI and translates between the
 * provider interface and the protobuf messages that cross it. The plugin
 * performs its device list and bundle queries through the host IQ channel.
 *
 * The instance owns both the library handle and the provider handle; the
 * provider is destroyed before the library is unloaded.
 */
class PluginEncryptionProvider final : public interfaces::IEncryptionProvider {
public:
    /**
     * @brief Loads the plugin and opens the provider store
     *
     * @param plugin_path Shared library implementing the provider ABI
     * @param data_dir Directory holding the provider's key, session and trust store
     * @param own_jid Account the provider encrypts on behalf of
     * @param iq_channel Channel for the provider's IQ queries; must outlive the provider
     * @param iq_timeout Timeout used when the plugin does not request one
     *
     * @return CouldNotLoad, MissingSymbol, AbiMismatch or InitFailed on failure
     */
    [[nodiscard]] static Result<std::unique_ptr<PluginEncryptionProvider>, PluginFailure> Load(
        const std::filesystem::path& plugin_path,
        const std::filesystem::path& data_dir,
        const models::BareJid& own_jid,
        interfaces::IIqChannel& iq_channel,
        std::chrono::milliseconds iq_timeout);

    ~PluginEncryptionProvider() override;

    [[nodiscard]] models::EncryptOutcome Encrypt(
        const std::string& plaintext,
        const std::vector<models::BareJid>& recipients,
        const models::ExpectedProblems& expected_problems) override;

    [[nodiscard]] Result<Unit, WorkflowFailure> RecordTrust(
        const models::DeviceAddress& address,
        const models::IdentityKey& identity_key,
        models::TrustDecision decision) override;

    [[nodiscard]] std::string_view EncryptionNamespace() const override {
        return encryption_namespace_;
    }

    PluginEncryptionProvider(const PluginEncryptionProvider&) = delete;
    PluginEncryptionProvider& operator=(const PluginEncryptionProvider&) = delete;
    PluginEncryptionProvider(PluginEncryptionProvider&&) = delete;
    PluginEncryptionProvider& operator=(PluginEncryptionProvider&&) = delete;

private:
    struct LibraryCloser {
        void operator()(void* library) const noexcept;
    };
    using LibraryHandle = std::unique_ptr<void, LibraryCloser>;

    struct Symbols {
        osp_plugin_abi_version_fn abi_version = nullptr;
        osp_plugin_encryption_namespace_fn encryption_namespace = nullptr;
        osp_provider_create_fn create = nullptr;
        osp_provider_destroy_fn destroy = nullptr;
        osp_provider_encrypt_fn encrypt = nullptr;
        osp_provider_set_trust_fn set_trust = nullptr;
        osp_buffer_free_fn buffer_free = nullptr;
        osp_error_free_fn error_free = nullptr;
    };

    PluginEncryptionProvider(
        LibraryHandle library,
        const Symbols& symbols,
        std::string encryption_namespace,
        std::string own_jid,
        interfaces::IIqChannel& iq_channel,
        std::chrono::milliseconds iq_timeout);

    [[nodiscard]] static Result<Symbols, PluginFailure> ResolveSymbols(void* library);

    /// Takes the message out of an error filled by the plugin and releases it
    [[nodiscard]] std::string TakeErrorMessage(OspErrorCode code, OspError& error) const;

    static OspIqStatus IqRoundTrip(
        void* host_data,
        const char* iq_xml,
        size_t iq_xml_length,
        uint32_t timeout_ms,
        OspIqResponseSink sink,
        void* sink_data);

    LibraryHandle library_;
    Symbols symbols_;
    std::string encryption_namespace_;
    std::string own_jid_;
    interfaces::IIqChannel& iq_channel_;
    std::chrono::milliseconds iq_timeout_;
    OspHostServices host_services_{};
    OspProviderHandle* handle_ = nullptr;
};

}
