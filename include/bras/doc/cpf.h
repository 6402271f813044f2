/**
 * @file cpf.h
 * @brief Value Object for the Brazilian CPF (Cadastro de Pessoas Fisicas)
 *
 * A CPF is an 11-digit number whose last two digits are mod-11 verifier
 * digits. Accepted inputs are the bare digits ("98484485439") or the
 * canonical punctuated form ("984.844.854-39").
 *
 * @example
 * auto result = bras::doc::Cpf::parse("984.844.854-39");
 * if (result) {
 *     result.value().toString();          // "984.844.854-39"
 *     result.value().numbersAsString();   // "98484485439"
 *     result.value().toUint64();          // 98484485439
 * }
 */

#pragma once

#include "bras/exception/domain_exception.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace bras::doc {

/**
 * @brief Reason a CPF could not be constructed
 *
 * More codes may be added in later versions. Callers switching on this
 * enum must keep a default branch.
 */
enum class ParseCpfError {
    INVALID,    ///< Wrong shape, repeated digits or bad verifier digit
    OTHER       ///< Reserved
};

/**
 * @brief Stable textual code for a ParseCpfError ("INVALID_CPF", ...)
 */
std::string toString(ParseCpfError error);

/**
 * @brief Thrown by the throwing CPF factories
 */
class CpfException : public bras::exception::DomainException {
private:
    ParseCpfError error_;

public:
    explicit CpfException(ParseCpfError error);

    [[nodiscard]] ParseCpfError getError() const noexcept {
        return error_;
    }
};

class CpfParseResult;

/**
 * @brief CPF Value Object
 *
 * Immutable once constructed. Equality, ordering and hashing follow the
 * numeric value.
 */
class Cpf {
private:
    uint64_t value_;

    explicit Cpf(uint64_t value) : value_(value) {}

public:
    /**
     * @brief Parse a CPF from text
     *
     * @param str 11 digits, or 14 characters in the form DDD.DDD.DDD-DD
     * @return CpfParseResult holding the Cpf or ParseCpfError::INVALID
     */
    static CpfParseResult parse(const std::string& str);

    /**
     * @brief Build a CPF from its numeric value
     *
     * The value is zero-padded to 11 digits and validated like text, so
     * 1678346063 is read as "01678346063".
     */
    static CpfParseResult tryFrom(uint64_t value);

    /**
     * @brief Parse a CPF from text, throwing on failure
     * @throws CpfException if str is not a valid CPF
     */
    static Cpf of(const std::string& str);

    /**
     * @brief Check whether text is a valid CPF
     */
    static bool isValid(const std::string& str);

    /**
     * @brief Canonical form, always 14 characters: "016.783.460-63"
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Decimal digits without punctuation or zero padding
     *
     * "016.783.460-63" gives "1678346063" (10 characters).
     */
    [[nodiscard]] std::string numbersAsString() const;

    [[nodiscard]] uint64_t toUint64() const noexcept {
        return value_;
    }

    bool operator==(const Cpf& other) const noexcept {
        return value_ == other.value_;
    }

    bool operator!=(const Cpf& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Cpf& other) const noexcept {
        return value_ < other.value_;
    }

    bool operator<=(const Cpf& other) const noexcept {
        return !(other < *this);
    }

    bool operator>(const Cpf& other) const noexcept {
        return other < *this;
    }

    bool operator>=(const Cpf& other) const noexcept {
        return !(*this < other);
    }
};

/**
 * @brief Outcome of a non-throwing CPF factory
 *
 * Holds either a Cpf or a ParseCpfError, never both.
 */
class CpfParseResult {
private:
    std::optional<Cpf> cpf_;
    ParseCpfError error_ = ParseCpfError::INVALID;

    CpfParseResult() = default;

public:
    static CpfParseResult success(const Cpf& cpf);
    static CpfParseResult failure(ParseCpfError error);

    [[nodiscard]] bool isValid() const noexcept {
        return cpf_.has_value();
    }

    explicit operator bool() const noexcept {
        return isValid();
    }

    /**
     * @brief The parsed CPF
     * @throws CpfException if parsing failed
     */
    [[nodiscard]] const Cpf& value() const;

    /**
     * @brief Why parsing failed
     * @throws std::logic_error if parsing succeeded
     */
    [[nodiscard]] ParseCpfError error() const;

    [[nodiscard]] std::optional<Cpf> toOptional() const {
        return cpf_;
    }
};

/**
 * @brief Write the canonical form of a CPF
 */
std::ostream& operator<<(std::ostream& os, const Cpf& cpf);

} // namespace bras::doc

namespace std {
    template<>
    struct hash<bras::doc::Cpf> {
        size_t operator()(const bras::doc::Cpf& cpf) const noexcept {
            return hash<uint64_t>()(cpf.toUint64());
        }
    };
}
