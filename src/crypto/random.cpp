#include "securand/random.hpp"
#include <limits>

namespace securand::crypto {

Result<uint64_t> Random::next_uint64(EntropySource& source) {
    fixed_bytes<constants::UINT64_BYTES> buffer{};
    SECURAND_TRY(source.fill(buffer.data(), buffer.size()));

    uint64_t value = 0;
    for (size_t i = 0; i < buffer.size(); ++i) {
        value |= static_cast<uint64_t>(buffer[i]) << (8 * i);
    }
    return Result<uint64_t>::Ok(value);
}

Result<int64_t> Random::number(EntropySource& source) {
    uint64_t value = 0;
    SECURAND_TRY_ASSIGN(value, next_uint64(source));
    return Result<int64_t>::Ok(static_cast<int64_t>(value));
}

uint64_t Random::rejection_threshold(uint64_t span) {
    if (span == 0) {
        return 0;
    }
    // (2^64 - span) mod span == 2^64 mod span
    return (0 - span) % span;
}

Result<int64_t> Random::number_in_range(int64_t min, int64_t max, EntropySource& source) {
    if (min > max) {
        return Result<int64_t>::Err(Error(ErrorCode::InvalidRange, "min must not exceed max",
                                          std::to_string(min) + " > " + std::to_string(max)));
    }
    if (min == max) {
        return Result<int64_t>::Ok(min);
    }

    // max - min never overflows in unsigned arithmetic
    const uint64_t range = static_cast<uint64_t>(max) - static_cast<uint64_t>(min);
    if (range == std::numeric_limits<uint64_t>::max()) {
        return number(source);
    }

    const uint64_t span = range + 1;
    const uint64_t threshold = rejection_threshold(span);

    uint64_t draw = 0;
    do {
        SECURAND_TRY_ASSIGN(draw, next_uint64(source));
    } while (draw < threshold);

    const uint64_t offset = draw % span;
    return Result<int64_t>::Ok(static_cast<int64_t>(static_cast<uint64_t>(min) + offset));
}

Result<std::string> Random::string(EntropySource& source) {
    return string_with_charset(constants::DEFAULT_LENGTH, constants::DEFAULT_CHARSET, source);
}

Result<std::string> Random::string_with_length(int length, EntropySource& source) {
    return string_with_charset(length, constants::DEFAULT_CHARSET, source);
}

Result<std::string> Random::string_with_charset(int length, const std::string& charset,
                                                EntropySource& source) {
    if (length < 0) {
        return Result<std::string>::Err(Error(ErrorCode::InvalidLength, "length must not be negative",
                                              "length " + std::to_string(length)));
    }
    if (charset.empty()) {
        return Result<std::string>::Err(ErrorCode::InvalidCharset, "charset must not be empty");
    }

    const int64_t last = static_cast<int64_t>(charset.size()) - 1;

    std::string result;
    result.reserve(static_cast<size_t>(length));
    for (int i = 0; i < length; ++i) {
        int64_t index = 0;
        SECURAND_TRY_ASSIGN(index, number_in_range(0, last, source));
        result.push_back(charset[static_cast<size_t>(index)]);
    }
    return Result<std::string>::Ok(std::move(result));
}

Result<securand::bytes> Random::bytes(size_t size, EntropySource& source) {
    securand::bytes result(size);
    SECURAND_TRY(source.fill(result.data(), result.size()));
    return Result<securand::bytes>::Ok(std::move(result));
}

} // namespace securand::crypto
