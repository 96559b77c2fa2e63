#pragma once

#include "domain/value_objects/MoneyError.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

namespace money::domain {

class Money;

// Either the parsed/summed value or the reason it could not be produced.
using MoneyResult = std::variant<Money, MoneyError>;

// A monetary amount as a signed count of cents plus a 3-character currency
// code, written as "10.00 USD". The fraction is always two digits regardless
// of the currency's real subunit.
class Money {
public:
    // No validation. Untrusted input goes through parse().
    Money(int64_t cents, std::string currency);

    // Accepts "<dollars>[.<cc>] <currency>". A leading '-' on the dollars
    // negates the whole amount, so "-0.50 USD" is -50 cents.
    // Cents and currency lengths count UTF-8 code points, not graphemes, so a
    // decomposed "e\u0301UR" is four characters and fails as InvalidCurrency.
    // Never throws on malformed input; the error is returned instead.
    static MoneyResult parse(const std::string& input);

    // parse() for trusted input. Throws MoneyException on failure.
    static Money from_string(const std::string& input);

    // Same-currency addition. Throws MoneyException with CurrencyMismatch
    // or Overflow.
    static Money add(const Money& left, const Money& right);
    static MoneyResult try_add(const Money& left, const Money& right);

    int64_t cents() const noexcept { return cents_; }
    const std::string& currency() const noexcept { return currency_; }

    // Canonical form, e.g. "10.01 USD" or "-0.05 USD".
    std::string to_string() const;

    // Debug form: the literal that rebuilds this value, "\"10.00 USD\"_money".
    std::string inspect() const;

    bool operator==(const Money&) const = default;

private:
    int64_t cents_;
    std::string currency_;
};

Money operator+(const Money& left, const Money& right);

std::ostream& operator<<(std::ostream& os, const Money& money);

namespace literals {

// "10.00 USD"_money. Throws MoneyException on invalid input.
Money operator""_money(const char* str, std::size_t len);

} // namespace literals

} // namespace money::domain
