#pragma once

#include "securand/common.hpp"
#include "securand/error.hpp"

namespace securand::crypto {

/**
 * Provider of cryptographically secure random bytes.
 * Implementations must be safe for concurrent use.
 */
class EntropySource {
public:
    virtual ~EntropySource() = default;

    /**
     * Fill a buffer with secure random bytes
     * @param buffer Buffer to fill
     * @param size Number of bytes
     * @return Ok, or EntropyUnavailable if the source cannot supply bytes
     */
    virtual Result<void> fill(byte* buffer, size_t size) = 0;
};

/**
 * Operating system CSPRNG through libsodium's randombytes API
 */
class SystemEntropy final : public EntropySource {
public:
    SystemEntropy() = default;
    SECURAND_DISALLOW_COPY_AND_MOVE(SystemEntropy);

    Result<void> fill(byte* buffer, size_t size) override;

    /**
     * Whether libsodium initialized successfully. Initialization runs once
     * per process on first use.
     */
    static bool available();
};

/**
 * Process-wide system entropy source, the default for every Random operation
 */
EntropySource& system_entropy();

} // namespace securand::crypto
