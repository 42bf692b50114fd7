#pragma once
#include "omemo_send/core/constants.hpp"
#include "omemo_send/core/failures.hpp"
#include "omemo_send/core/result.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace omemo_send::configuration {

enum class Verbosity : uint8_t {
    Error,
    Info,
    Debug
};

enum class TrustPolicy : uint8_t {
    Auto,
    Prompt,
    AllowList
};

struct CliOptions {
    std::optional<std::string> to;
    std::optional<std::string> message;
    std::optional<std::string> jid;
    std::filesystem::path data_dir;
    std::optional<std::filesystem::path> plugin_path;
    Verbosity verbosity = Verbosity::Info;
    TrustPolicy trust_policy = TrustPolicy::Auto;
    std::set<std::string> trusted_keys;
    uint32_t max_attempts = WorkflowConstants::DEFAULT_MAX_ATTEMPTS;
    std::chrono::milliseconds iq_timeout = WorkflowConstants::DEFAULT_IQ_TIMEOUT;
    bool allow_plaintext = false;
};

/// Parses the command line. Both `--flag value` and `--flag=value` are accepted;
/// when `-q` and `-d` are both given the last one wins.
[[nodiscard]] Result<CliOptions, ConfigFailure> ParseArgs(
    int argc,
    const char* const* argv,
    const std::filesystem::path& default_data_dir);

/// Path of the running binary from /proc/self/exe. `argv0` is only used when
/// the link cannot be read; a bare program name then resolves against the cwd.
[[nodiscard]] std::filesystem::path ResolveExecutablePath(const char* argv0);

[[nodiscard]] std::filesystem::path DataDirBeside(const std::filesystem::path& executable);

/// `omemo` next to the executable
[[nodiscard]] std::filesystem::path DefaultDataDir(const char* argv0);

[[nodiscard]] std::string UsageText(std::string_view program);

}
