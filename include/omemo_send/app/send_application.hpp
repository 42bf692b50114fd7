#pragma once
#include "omemo_send/configuration/cli_options.hpp"
#include "omemo_send/core/failures.hpp"
#include "omemo_send/core/result.hpp"
#include "omemo_send/interfaces/i_trust_decision_strategy.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace omemo_send::app {

/**
 * @brief Command line front end of omemo-send
 *
 * Resolves the options (flags, environment, interactive prompts), prepares
 * the data directory, loads the provider plugin, connects and runs the send
 * workflow once the session starts.
 *
 * Exit codes are those of ExitCodes.
 */
class SendApplication {
public:
    SendApplication(std::istream& input, std::ostream& output, std::ostream& errors)
        : input_(input), output_(output), errors_(errors) {}

    [[nodiscard]] int Run(int argc, const char* const* argv);

    [[nodiscard]] static std::unique_ptr<interfaces::ITrustDecisionStrategy> MakeTrustStrategy(
        const configuration::CliOptions& options,
        std::istream& input,
        std::ostream& output);

private:
    struct Account {
        std::string jid;
        std::string password;
    };

    [[nodiscard]] std::string Prompt(const std::string& label);
    [[nodiscard]] std::string PromptSecret(const std::string& label);
    [[nodiscard]] Result<Account, ConfigFailure> ResolveAccount(const configuration::CliOptions& options);
    [[nodiscard]] int Execute(configuration::CliOptions& options, Account& account);

    std::istream& input_;
    std::ostream& output_;
    std::ostream& errors_;
};

}
