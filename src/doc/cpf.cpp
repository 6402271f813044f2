/**
 * @file cpf.cpp
 * @brief CPF Value Object implementation
 */

#include "bras/doc/cpf.h"
#include "bras/doc/check_digit.h"
#include "bras/utils/string_utils.h"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace bras::doc {

namespace {

constexpr size_t PLAIN_LENGTH = 11;
constexpr size_t PUNCTUATED_LENGTH = 14;

// Rejections are logged by reason only; the CPF itself is personal data
CpfParseResult reject(const char* reason, size_t inputLength) {
    spdlog::debug("CPF rejected: {} (input length {})", reason, inputLength);
    return CpfParseResult::failure(ParseCpfError::INVALID);
}

bool hasCanonicalSeparators(const std::string& str) {
    return str[3] == '.' && str[7] == '.' && str[11] == '-';
}

} // anonymous namespace

std::string toString(ParseCpfError error) {
    switch (error) {
        case ParseCpfError::INVALID: return "INVALID_CPF";
        case ParseCpfError::OTHER: return "OTHER";
        default: return "UNKNOWN";
    }
}

CpfException::CpfException(ParseCpfError error)
    : DomainException(toString(error),
                      "CPF must be 11 digits (optionally DDD.DDD.DDD-DD) with valid verifier digits"),
      error_(error) {}

// --- Cpf ---

CpfParseResult Cpf::parse(const std::string& str) {
    if (str.length() != PLAIN_LENGTH && str.length() != PUNCTUATED_LENGTH) {
        return reject("length must be 11 or 14", str.length());
    }

    if (str.length() == PUNCTUATED_LENGTH && !hasCanonicalSeparators(str)) {
        return reject("separators must be at positions 3, 7 and 11", str.length());
    }

    // Filter the whole string, not just the separator positions
    std::string numbers = utils::digitsOnly(str);
    if (numbers.length() != CPF_DIGIT_COUNT) {
        return reject("expected 11 digits", str.length());
    }

    if (utils::allSameChar(numbers)) {
        return reject("all digits are equal", str.length());
    }

    CpfDigits digits{};
    uint64_t value = 0;
    for (size_t i = 0; i < CPF_DIGIT_COUNT; ++i) {
        digits[i] = static_cast<uint32_t>(numbers[i] - '0');
        value = value * 10 + digits[i];
    }

    if (firstVerifierDigit(digits) != digits[9]) {
        return reject("first verifier digit mismatch", str.length());
    }

    if (secondVerifierDigit(digits) != digits[10]) {
        return reject("second verifier digit mismatch", str.length());
    }

    return CpfParseResult::success(Cpf(value));
}

CpfParseResult Cpf::tryFrom(uint64_t value) {
    // Values above 11 digits stay longer than 11 and fail the length check
    return parse(utils::padLeft(std::to_string(value), PLAIN_LENGTH, '0'));
}

Cpf Cpf::of(const std::string& str) {
    return parse(str).value();
}

bool Cpf::isValid(const std::string& str) {
    return parse(str).isValid();
}

std::string Cpf::toString() const {
    std::string digits = utils::padLeft(std::to_string(value_), PLAIN_LENGTH, '0');
    return digits.substr(0, 3) + "." + digits.substr(3, 3) + "." +
           digits.substr(6, 3) + "-" + digits.substr(9);
}

std::string Cpf::numbersAsString() const {
    return std::to_string(value_);
}

std::ostream& operator<<(std::ostream& os, const Cpf& cpf) {
    return os << cpf.toString();
}

// --- CpfParseResult ---

CpfParseResult CpfParseResult::success(const Cpf& cpf) {
    CpfParseResult result;
    result.cpf_ = cpf;
    return result;
}

CpfParseResult CpfParseResult::failure(ParseCpfError error) {
    CpfParseResult result;
    result.error_ = error;
    return result;
}

const Cpf& CpfParseResult::value() const {
    if (!cpf_) {
        throw CpfException(error_);
    }
    return *cpf_;
}

ParseCpfError CpfParseResult::error() const {
    if (cpf_) {
        throw std::logic_error("CpfParseResult::error() called on a successful result");
    }
    return error_;
}

} // namespace bras::doc
