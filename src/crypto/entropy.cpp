#include "securand/entropy.hpp"
#include "utils/logger.hpp"
#include <sodium.h>

namespace securand::crypto {

namespace {
    bool initialize_sodium() {
        if (sodium_init() < 0) {
            SECURAND_LOG_CRITICAL("libsodium initialization failed, secure random bytes unavailable");
            return false;
        }
        SECURAND_LOG_DEBUG("libsodium {} initialized, randombytes implementation: {}",
                           sodium_version_string(), randombytes_implementation_name());
        return true;
    }
}

bool SystemEntropy::available() {
    static const bool initialized = initialize_sodium();
    return initialized;
}

Result<void> SystemEntropy::fill(byte* buffer, size_t size) {
    if (size == 0) {
        return Result<void>::Ok();
    }
    if (!available()) {
        return Result<void>::Err(ErrorCode::EntropyUnavailable, "libsodium is not initialized");
    }
    randombytes_buf(buffer, size);
    return Result<void>::Ok();
}

EntropySource& system_entropy() {
    static SystemEntropy instance;
    return instance;
}

} // namespace securand::crypto
