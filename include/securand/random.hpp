#pragma once

#include "securand/common.hpp"
#include "securand/error.hpp"
#include "securand/entropy.hpp"
#include <string>
#include <utility>

namespace securand::crypto {

/**
 * Cryptographically secure random values.
 *
 * Every operation is stateless and draws from an EntropySource, by default
 * the libsodium-backed system source. Bounded draws use rejection sampling,
 * never plain modulo reduction, so results are exactly uniform.
 */
class Random {
public:
    /**
     * Uniform value over the full signed 64-bit range.
     * Reads 8 bytes, assembled little-endian.
     */
    static Result<int64_t> number(EntropySource& source = system_entropy());

    /**
     * Uniform value in the closed interval [min, max].
     *
     * min == max returns min without consuming entropy. Otherwise 64-bit draws
     * below rejection_threshold(span) are discarded before reducing modulo
     * span, where span = max - min + 1. A single draw is rejected with
     * probability rejection_threshold(span) / 2^64, which is below 1/2 for
     * every span and below 2^-32 for spans up to 2^32.
     *
     * @return InvalidRange if min > max
     */
    static Result<int64_t> number_in_range(int64_t min, int64_t max,
                                           EntropySource& source = system_entropy());

    /**
     * Number of 64-bit draws rejected for a span: 2^64 mod span.
     * Draws v with v < threshold are redrawn. A span of 0 stands for 2^64
     * and has threshold 0.
     */
    static uint64_t rejection_threshold(uint64_t span);

    /**
     * constants::DEFAULT_LENGTH characters from constants::DEFAULT_CHARSET
     */
    static Result<std::string> string(EntropySource& source = system_entropy());

    /**
     * @param length Number of characters; 0 yields an empty string
     * @return InvalidLength if length is negative
     */
    static Result<std::string> string_with_length(int length,
                                                  EntropySource& source = system_entropy());

    /**
     * Random string over a caller-supplied charset. Each byte position of the
     * charset is equally likely, so repeated characters weigh more.
     *
     * @return InvalidLength if length is negative (checked first),
     *         InvalidCharset if charset is empty, even when length is 0
     */
    static Result<std::string> string_with_charset(int length, const std::string& charset,
                                                   EntropySource& source = system_entropy());

    /**
     * Raw secure bytes
     */
    static Result<securand::bytes> bytes(size_t size, EntropySource& source = system_entropy());

    /**
     * One uniformly chosen element of a random-access sequence.
     * The sequence is not modified.
     * @return EmptySequence if the sequence has no elements
     */
    template<typename Sequence>
    static Result<typename Sequence::value_type> pick(const Sequence& sequence,
                                                      EntropySource& source = system_entropy());

    /**
     * Fisher-Yates shuffle of a random-access sequence in place.
     * On failure the sequence holds a permutation of its original elements.
     */
    template<typename Sequence>
    static Result<void> shuffle(Sequence& sequence, EntropySource& source = system_entropy());

private:
    static Result<uint64_t> next_uint64(EntropySource& source);
};

template<typename Sequence>
Result<typename Sequence::value_type> Random::pick(const Sequence& sequence, EntropySource& source) {
    using value_type = typename Sequence::value_type;

    if (sequence.empty()) {
        return Result<value_type>::Err(ErrorCode::EmptySequence, "cannot pick from an empty sequence");
    }

    int64_t index = 0;
    SECURAND_TRY_ASSIGN(index, number_in_range(0, static_cast<int64_t>(sequence.size()) - 1, source));
    return Result<value_type>::Ok(sequence[static_cast<size_t>(index)]);
}

template<typename Sequence>
Result<void> Random::shuffle(Sequence& sequence, EntropySource& source) {
    using std::swap;

    if (sequence.size() < 2) {
        return Result<void>::Ok();
    }

    for (size_t i = sequence.size() - 1; i > 0; --i) {
        int64_t j = 0;
        SECURAND_TRY_ASSIGN(j, number_in_range(0, static_cast<int64_t>(i), source));
        swap(sequence[i], sequence[static_cast<size_t>(j)]);
    }
    return Result<void>::Ok();
}

} // namespace securand::crypto
