#include "omemo_send/app/send_application.hpp"
#include "omemo_send/configuration/workflow_config.hpp"
#include "omemo_send/core/constants.hpp"
#include "omemo_send/crypto/sodium_interop.hpp"
#include "omemo_send/logging/logging.hpp"
#include "omemo_send/models/bare_jid.hpp"
#include "omemo_send/plugin/plugin_encryption_provider.hpp"
#include "omemo_send/trust/trust_strategies.hpp"
#include "omemo_send/workflow/encrypted_send_workflow.hpp"
#include "omemo_send/xmpp/strophe_session.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <termios.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace omemo_send::app {

using configuration::CliOptions;
using crypto::SodiumInterop;

namespace {

/// Turns terminal echo off for its lifetime
class EchoSuppressor {
public:
    EchoSuppressor() {
        if (tcgetattr(STDIN_FILENO, &saved_) != 0) {
            return;
        }
        termios silent = saved_;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
    }

    ~EchoSuppressor() {
        if (active_) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
        }
    }

    EchoSuppressor(const EchoSuppressor&) = delete;
    EchoSuppressor& operator=(const EchoSuppressor&) = delete;

private:
    termios saved_{};
    bool active_ = false;
};

std::string ProgramName(const int argc, const char* const* argv) {
    if (argc > 0 && argv[0] != nullptr && *argv[0] != '\0') {
        return std::filesystem::path(argv[0]).filename().string();
    }
    return "omemo-send";
}

std::optional<std::string> FromEnvironment(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

void Wipe(std::string& secret, const char* what) {
    if (const auto wiped = SodiumInterop::SecureWipe(secret); wiped.IsErr()) {
        spdlog::warn("Could not wipe {}: {}", what, wiped.UnwrapErr().message);
    }
}

}

std::unique_ptr<interfaces::ITrustDecisionStrategy> SendApplication::MakeTrustStrategy(
    const CliOptions& options,
    std::istream& input,
    std::ostream& output) {
    switch (options.trust_policy) {
        case configuration::TrustPolicy::Prompt:
            return std::make_unique<trust::PromptTrustStrategy>(input, output);
        case configuration::TrustPolicy::AllowList:
            return std::make_unique<trust::AllowListTrustStrategy>(options.trusted_keys);
        case configuration::TrustPolicy::Auto:
            break;
    }
    return std::make_unique<trust::AutoTrustStrategy>();
}

int SendApplication::Run(const int argc, const char* const* argv) {
    const auto program = ProgramName(argc, argv);

    auto parsed = configuration::ParseArgs(
        argc, argv, configuration::DefaultDataDir(argc > 0 ? argv[0] : nullptr));
    if (parsed.IsErr()) {
        const auto& failure = parsed.UnwrapErr();
        if (failure.type == ConfigFailureType::HelpRequested) {
            output_ << configuration::UsageText(program);
            return ExitCodes::SUCCESS;
        }
        errors_ << program << ": error: " << failure.message << "\n"
                << configuration::UsageText(program);
        return ExitCodes::USAGE;
    }
    auto options = std::move(parsed).Unwrap();

    logging::Initialize(options.verbosity);

    if (const auto initialized = SodiumInterop::Initialize(); initialized.IsErr()) {
        spdlog::critical("{}", initialized.UnwrapErr().message);
        return ExitCodes::WORKFLOW_FAILED;
    }

    if (!options.to.has_value()) {
        options.to = Prompt("Send To: ");
    }
    if (!options.message.has_value()) {
        options.message = Prompt("Message: ");
    }

    auto account = ResolveAccount(options);
    if (account.IsErr()) {
        spdlog::error("{}", account.UnwrapErr().message);
        return ExitCodes::USAGE;
    }
    auto resolved = std::move(account).Unwrap();

    const int exit_code = Execute(options, resolved);

    Wipe(resolved.password, "password");
    Wipe(*options.message, "message");
    return exit_code;
}

Result<SendApplication::Account, ConfigFailure> SendApplication::ResolveAccount(const CliOptions& options) {
    using AccountResult = Result<Account, ConfigFailure>;

    Account account;
    if (options.jid.has_value()) {
        account.jid = *options.jid;
    } else if (auto from_env = FromEnvironment(EnvironmentVariables::JID)) {
        account.jid = std::move(*from_env);
    } else {
        account.jid = Prompt("JID: ");
    }

    if (auto from_env = FromEnvironment(EnvironmentVariables::PASSWORD)) {
        account.password = std::move(*from_env);
    } else {
        account.password = PromptSecret("Password: ");
    }
    if (account.password.empty()) {
        return AccountResult::Err(ConfigFailure::MissingValue(
            fmt::format("no password given; set {} or enter it when asked", EnvironmentVariables::PASSWORD)));
    }
    return AccountResult::Ok(std::move(account));
}

int SendApplication::Execute(CliOptions& options, Account& account) {
    auto recipient = models::BareJid::Parse(*options.to);
    if (recipient.IsErr()) {
        spdlog::error("Invalid recipient: {}", recipient.UnwrapErr().message);
        return ExitCodes::USAGE;
    }
    auto own_jid = models::BareJid::Parse(account.jid);
    if (own_jid.IsErr()) {
        spdlog::error("Invalid account: {}", own_jid.UnwrapErr().message);
        return ExitCodes::USAGE;
    }
    auto config = configuration::WorkflowConfig::WithMaxAttempts(options.max_attempts);
    if (config.IsErr()) {
        spdlog::error("{}", config.UnwrapErr().message);
        return ExitCodes::USAGE;
    }

    const auto data_dir_created = Result<Unit, ConfigFailure>::Try(
        [&options] { std::filesystem::create_directories(options.data_dir); },
        [&options](const std::exception& ex) {
            return ConfigFailure::DataDirectory(
                fmt::format("could not create {}: {}", options.data_dir.string(), ex.what()));
        });
    if (data_dir_created.IsErr()) {
        spdlog::error("{}", data_dir_created.UnwrapErr().message);
        return ExitCodes::USAGE;
    }

    auto created = xmpp::StropheSession::Create();
    if (created.IsErr()) {
        spdlog::error("{}", created.UnwrapErr().message);
        return ExitCodes::CONNECTION_FAILED;
    }
    auto session = std::move(created).Unwrap();

    auto plugin_path = options.plugin_path;
    if (!plugin_path.has_value()) {
        if (auto from_env = FromEnvironment(EnvironmentVariables::PLUGIN)) {
            plugin_path = std::filesystem::path(*from_env);
        }
    }
    if (!plugin_path.has_value()) {
        spdlog::error("An error occurred when loading the encryption plugin: no plugin configured (--plugin or {})",
                      EnvironmentVariables::PLUGIN);
        return ExitCodes::PLUGIN_LOAD_FAILED;
    }

    auto loaded = plugin::PluginEncryptionProvider::Load(
        *plugin_path, options.data_dir, own_jid.Unwrap(), *session, options.iq_timeout);
    if (loaded.IsErr()) {
        spdlog::error("An error occurred when loading the encryption plugin: {}", loaded.UnwrapErr().message);
        return ExitCodes::PLUGIN_LOAD_FAILED;
    }
    auto provider = std::move(loaded).Unwrap();
    if (provider->EncryptionNamespace() == XmppNamespaces::OMEMO_LEGACY) {
        session->AddFeature(std::string(XmppNamespaces::OMEMO_LEGACY_DEVICELIST_NOTIFY));
    }

    const auto strategy = MakeTrustStrategy(options, input_, output_);
    workflow::EncryptedSendWorkflow workflow(*provider, *strategy, config.Unwrap());

    std::optional<Result<models::SendResult, WorkflowFailure>> outcome;
    const auto& to = recipient.Unwrap();
    const auto& message = *options.message;
    session->OnSessionStart([&outcome, &workflow, &to, &message](xmpp::StropheSession& started) {
        outcome.emplace(workflow.Send(started, to, message));
    });

    xmpp::ConnectionSettings settings{own_jid.Unwrap(), account.password, options.allow_plaintext};
    const auto connected = session->Connect(settings);
    Wipe(settings.password, "password");
    if (connected.IsErr()) {
        spdlog::error("{}", connected.UnwrapErr().message);
        return ExitCodes::CONNECTION_FAILED;
    }

    if (const auto ran = session->Run(); ran.IsErr()) {
        spdlog::error("{}", ran.UnwrapErr().message);
        return ExitCodes::CONNECTION_FAILED;
    }
    if (!outcome.has_value()) {
        spdlog::error("The session ended before the message could be sent");
        return ExitCodes::CONNECTION_FAILED;
    }
    if (outcome->IsErr()) {
        spdlog::error("Sending failed: {}", outcome->UnwrapErr().message);
        return ExitCodes::WORKFLOW_FAILED;
    }

    const auto& result = outcome->Unwrap();
    if (result.IsSent()) {
        spdlog::info("Message sent after {} attempt(s)", result.attempts);
    } else {
        spdlog::warn("Message not sent ({}) after {} attempt(s)", result.reason, result.attempts);
    }
    return ExitCodes::SUCCESS;
}

std::string SendApplication::Prompt(const std::string& label) {
    output_ << label << std::flush;
    std::string line;
    if (!std::getline(input_, line)) {
        return {};
    }
    return line;
}

std::string SendApplication::PromptSecret(const std::string& label) {
    if (&input_ != &std::cin || isatty(STDIN_FILENO) == 0) {
        return Prompt(label);
    }
    output_ << label << std::flush;
    std::string line;
    {
        EchoSuppressor suppressor;
        if (!std::getline(input_, line)) {
            line.clear();
        }
    }
    output_ << "\n";
    return line;
}

}
