#include "omemo_send/configuration/cli_options.hpp"
#include <fmt/core.h>
#include <charconv>
#include <system_error>

namespace omemo_send::configuration {

namespace {

using ParseResult = Result<CliOptions, ConfigFailure>;

Result<uint64_t, ConfigFailure> ParseUnsigned(const std::string_view flag, const std::string_view text) {
    uint64_t value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return Result<uint64_t, ConfigFailure>::Err(ConfigFailure::InvalidValue(
            fmt::format("{} expects a non-negative integer, got '{}'", flag, text)));
    }
    return Result<uint64_t, ConfigFailure>::Ok(value);
}

Result<TrustPolicy, ConfigFailure> ParseTrustPolicy(const std::string_view text) {
    if (text == "auto") {
        return Result<TrustPolicy, ConfigFailure>::Ok(TrustPolicy::Auto);
    }
    if (text == "prompt") {
        return Result<TrustPolicy, ConfigFailure>::Ok(TrustPolicy::Prompt);
    }
    if (text == "allow-list") {
        return Result<TrustPolicy, ConfigFailure>::Ok(TrustPolicy::AllowList);
    }
    return Result<TrustPolicy, ConfigFailure>::Err(ConfigFailure::InvalidValue(
        fmt::format("--trust expects auto, prompt or allow-list, got '{}'", text)));
}

bool TakesValue(const std::string_view flag) {
    return flag == "-t" || flag == "--to" ||
           flag == "-m" || flag == "--message" ||
           flag == "-j" || flag == "--jid" ||
           flag == "--data-dir" || flag == "--plugin" ||
           flag == "--trust" || flag == "--trusted-key" ||
           flag == "--max-attempts" || flag == "--iq-timeout";
}

}

Result<CliOptions, ConfigFailure> ParseArgs(
    const int argc,
    const char* const* argv,
    const std::filesystem::path& default_data_dir) {
    CliOptions out;
    out.data_dir = default_data_dir;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            const auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg.resize(eq);
            }
        }

        if (arg == "-h" || arg == "--help") {
            return ParseResult::Err(ConfigFailure::HelpRequested());
        }
        if (arg == "-q" || arg == "--quiet") {
            out.verbosity = Verbosity::Error;
            continue;
        }
        if (arg == "-d" || arg == "--debug") {
            out.verbosity = Verbosity::Debug;
            continue;
        }
        if (arg == "--allow-plaintext") {
            out.allow_plaintext = true;
            continue;
        }
        if (!TakesValue(arg)) {
            return ParseResult::Err(ConfigFailure::UnknownOption(
                fmt::format("unrecognized argument '{}'", argv[i])));
        }

        std::string value;
        if (inline_value.has_value()) {
            value = *inline_value;
        } else {
            if (i + 1 >= argc) {
                return ParseResult::Err(ConfigFailure::MissingValue(
                    fmt::format("{} expects a value", arg)));
            }
            value = argv[++i];
        }

        if (arg == "-t" || arg == "--to") {
            out.to = value;
        } else if (arg == "-m" || arg == "--message") {
            out.message = value;
        } else if (arg == "-j" || arg == "--jid") {
            out.jid = value;
        } else if (arg == "--data-dir") {
            out.data_dir = value;
        } else if (arg == "--plugin") {
            out.plugin_path = std::filesystem::path(value);
        } else if (arg == "--trust") {
            auto policy = ParseTrustPolicy(value);
            if (policy.IsErr()) {
                return ParseResult::Err(std::move(policy).UnwrapErr());
            }
            out.trust_policy = policy.Unwrap();
        } else if (arg == "--trusted-key") {
            out.trusted_keys.insert(value);
        } else if (arg == "--max-attempts") {
            auto parsed = ParseUnsigned(arg, value);
            if (parsed.IsErr()) {
                return ParseResult::Err(std::move(parsed).UnwrapErr());
            }
            if (parsed.Unwrap() == 0 || parsed.Unwrap() > UINT32_MAX) {
                return ParseResult::Err(ConfigFailure::InvalidValue(
                    fmt::format("--max-attempts must be between 1 and {}", UINT32_MAX)));
            }
            out.max_attempts = static_cast<uint32_t>(parsed.Unwrap());
        } else if (arg == "--iq-timeout") {
            auto parsed = ParseUnsigned(arg, value);
            if (parsed.IsErr()) {
                return ParseResult::Err(std::move(parsed).UnwrapErr());
            }
            if (parsed.Unwrap() == 0) {
                return ParseResult::Err(ConfigFailure::InvalidValue("--iq-timeout must be positive"));
            }
            out.iq_timeout = std::chrono::milliseconds(parsed.Unwrap());
        }
    }

    if (out.trust_policy == TrustPolicy::AllowList && out.trusted_keys.empty()) {
        return ParseResult::Err(ConfigFailure::MissingValue(
            "--trust allow-list needs at least one --trusted-key"));
    }
    return ParseResult::Ok(std::move(out));
}

std::filesystem::path ResolveExecutablePath(const char* argv0) {
    std::error_code ec;
    auto executable = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && executable.is_absolute()) {
        return executable;
    }
    executable = std::filesystem::absolute(argv0 ? argv0 : "", ec);
    if (ec) {
        return {};
    }
    return executable;
}

std::filesystem::path DataDirBeside(const std::filesystem::path& executable) {
    return executable.parent_path() / "omemo";
}

std::filesystem::path DefaultDataDir(const char* argv0) {
    return DataDirBeside(ResolveExecutablePath(argv0));
}

std::string UsageText(const std::string_view program) {
    return fmt::format(
        "usage: {} [-h] [-q] [-d] [-t TO] [-m MESSAGE] [-j JID] [--data-dir DATA_DIR]\n"
        "          [--plugin PATH] [--trust auto|prompt|allow-list] [--trusted-key HEX]\n"
        "          [--max-attempts N] [--iq-timeout MS] [--allow-plaintext]\n"
        "\n"
        "Log in, send one OMEMO-encrypted message, and log out.\n"
        "\n"
        "options:\n"
        "  -h, --help            show this help message and exit\n"
        "  -q, --quiet           set logging to ERROR\n"
        "  -d, --debug           set logging to DEBUG\n"
        "  -t, --to TO           JID to send the message to\n"
        "  -m, --message MESSAGE message to send\n"
        "  -j, --jid JID         account to log in with (or ${})\n"
        "  --data-dir DATA_DIR   data directory of the encryption plugin\n"
        "  --plugin PATH         encryption plugin library (or ${})\n"
        "  --trust POLICY        decision for undecided devices (default: auto)\n"
        "  --trusted-key HEX     identity key fingerprint for --trust allow-list\n"
        "  --max-attempts N      encryption attempts before giving up (default: {});\n"
        "                        every retry settles one device, so N also bounds\n"
        "                        the devices of the recipient\n"
        "  --iq-timeout MS       timeout of each IQ request (default: {})\n"
        "  --allow-plaintext     do not require TLS\n"
        "\n"
        "The account password is read from ${} or prompted for.\n",
        program,
        EnvironmentVariables::JID,
        EnvironmentVariables::PLUGIN,
        WorkflowConstants::DEFAULT_MAX_ATTEMPTS,
        WorkflowConstants::DEFAULT_IQ_TIMEOUT.count(),
        EnvironmentVariables::PASSWORD);
}

}
