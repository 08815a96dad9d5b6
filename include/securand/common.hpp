#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>

// securand version
#define SECURAND_VERSION_STRING "0.1.0"

// Utility macros
#define SECURAND_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define SECURAND_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define SECURAND_DISALLOW_COPY_AND_MOVE(TypeName) \
    SECURAND_DISALLOW_COPY(TypeName); \
    SECURAND_DISALLOW_MOVE(TypeName)

// Basic types
namespace securand {

using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

} // namespace securand

// Named character sets
namespace securand {
namespace charset {

constexpr const char* UPPERCASE = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr const char* LOWERCASE = "abcdefghijklmnopqrstuvwxyz";
constexpr const char* DIGITS = "0123456789";
constexpr const char* ALPHANUMERIC =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789";
constexpr const char* HEX_LOWER = "0123456789abcdef";
constexpr const char* URL_SAFE =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789-_";

/**
 * Look up a named character set: alphanumeric, digits, lowercase,
 * uppercase, hex, urlsafe
 * @return nullptr for an unknown name
 */
const char* by_name(const std::string& name);

} // namespace charset

// Constants
namespace constants {

// String generation
constexpr int DEFAULT_LENGTH = 32;
constexpr const char* DEFAULT_CHARSET = charset::ALPHANUMERIC;

// Entropy
constexpr size_t UINT64_BYTES = 8;

} // namespace constants
} // namespace securand

// Hex encoding
namespace securand {

std::string to_hex(const bytes& data);
std::string to_hex(const void* data, size_t len);

} // namespace securand
