/**
 * @file check_digit.h
 * @brief CPF verifier digit computation (weighted sum, mod 11)
 *
 * Both verifier digits use the same scheme: multiply the preceding digits
 * by strictly decreasing weights ending in 2, sum, then reduce with
 * (sum * 10) % 11 where a result of 10 becomes 0.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace bras::doc {

/// @brief Number of digits in a CPF, verifier digits included
constexpr size_t CPF_DIGIT_COUNT = 11;

/// @brief CPF digits, most significant first, each in 0-9
using CpfDigits = std::array<uint32_t, CPF_DIGIT_COUNT>;

/// @brief Weights for the first verifier digit (applied to digits 1-9)
constexpr std::array<uint32_t, 9> FIRST_VERIFIER_WEIGHTS = {10, 9, 8, 7, 6, 5, 4, 3, 2};

/// @brief Weights for the second verifier digit (applied to digits 1-10)
constexpr std::array<uint32_t, 10> SECOND_VERIFIER_WEIGHTS = {11, 10, 9, 8, 7, 6, 5, 4, 3, 2};

/**
 * @brief Reduce a weighted sum to a single verifier digit
 *
 * @param sum Weighted sum of the preceding digits
 * @return (sum * 10) % 11, with 10 mapped to 0
 */
uint32_t reduceMod11(uint32_t sum) noexcept;

/**
 * @brief Pairwise product sum of digits and weights
 *
 * Only the first min(digitCount, weightCount) positions take part.
 */
uint32_t weightedSum(const uint32_t* digits, size_t digitCount,
                     const uint32_t* weights, size_t weightCount) noexcept;

/**
 * @brief Compute the expected 10th digit from digits 1-9
 */
uint32_t firstVerifierDigit(const CpfDigits& digits) noexcept;

/**
 * @brief Compute the expected 11th digit from digits 1-10
 *
 * Uses the digit actually present at position 10, not the computed one.
 */
uint32_t secondVerifierDigit(const CpfDigits& digits) noexcept;

} // namespace bras::doc
