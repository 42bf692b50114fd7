#pragma once

#include "omemo_send/core/result.hpp"
#include "omemo_send/core/failures.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace omemo_send::crypto {

/**
 * @brief Thin interop layer over libsodium
 *
 * The tool never handles key material itself. libsodium is used for the
 * few secrets it does touch (account password, plaintext) and for
 * rendering identity-key fingerprints.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    /**
     * @brief Check if libsodium is initialized
     */
    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer with sodium_memzero
     *
     * @param buffer Buffer to wipe
     * @return Ok on success, Err if libsodium is not initialized
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Securely wipe a string's contents and clear it
     *
     * Used for the account password and the plaintext once a run ends.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::string& secret);

    // ========================================================================
    // Encoding
    // ========================================================================

    /**
     * @brief Lower-case hex encoding via sodium_bin2hex
     *
     * Used to render identity-key fingerprints for trust decisions.
     */
    static std::string ToHex(std::span<const uint8_t> data);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Random bytes from randombytes_buf
     *
     * Used for the per-run resource suffix.
     */
    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace omemo_send::crypto
