#include "securand/common.hpp"

namespace securand {

std::string to_hex(const void* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    const byte* bytes_data = static_cast<const byte*>(data);

    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result += digits[bytes_data[i] >> 4];
        result += digits[bytes_data[i] & 0x0f];
    }
    return result;
}

std::string to_hex(const bytes& data) {
    return to_hex(data.data(), data.size());
}

namespace charset {

const char* by_name(const std::string& name) {
    if (name == "alphanumeric") {
        return ALPHANUMERIC;
    } else if (name == "digits") {
        return DIGITS;
    } else if (name == "lowercase") {
        return LOWERCASE;
    } else if (name == "uppercase") {
        return UPPERCASE;
    } else if (name == "hex") {
        return HEX_LOWER;
    } else if (name == "urlsafe") {
        return URL_SAFE;
    }
    return nullptr;
}

} // namespace charset

} // namespace securand
