/**
 * @file check_digit.cpp
 * @brief CPF verifier digit computation
 */

#include "bras/doc/check_digit.h"
#include <algorithm>

namespace bras::doc {

uint32_t reduceMod11(uint32_t sum) noexcept {
    uint32_t digit = (sum * 10) % 11;
    return digit == 10 ? 0 : digit;
}

uint32_t weightedSum(const uint32_t* digits, size_t digitCount,
                     const uint32_t* weights, size_t weightCount) noexcept {
    uint32_t sum = 0;
    size_t count = std::min(digitCount, weightCount);
    for (size_t i = 0; i < count; ++i) {
        sum += digits[i] * weights[i];
    }
    return sum;
}

uint32_t firstVerifierDigit(const CpfDigits& digits) noexcept {
    return reduceMod11(weightedSum(digits.data(), digits.size(),
                                   FIRST_VERIFIER_WEIGHTS.data(),
                                   FIRST_VERIFIER_WEIGHTS.size()));
}

uint32_t secondVerifierDigit(const CpfDigits& digits) noexcept {
    return reduceMod11(weightedSum(digits.data(), digits.size(),
                                   SECOND_VERIFIER_WEIGHTS.data(),
                                   SECOND_VERIFIER_WEIGHTS.size()));
}

} // namespace bras::doc
