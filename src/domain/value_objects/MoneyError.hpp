#pragma once

#include <stdexcept>
#include <string>

namespace money::domain {

enum class MoneyError {
    InvalidFormat,
    InvalidCents,
    InvalidCurrency,
    InvalidNumber,
    CurrencyMismatch,
    Overflow,
};

// snake_case name, e.g. "invalid_cents"
std::string to_string(MoneyError error);

class MoneyException : public std::invalid_argument {
public:
    explicit MoneyException(MoneyError kind);

    MoneyError kind() const noexcept { return kind_; }

private:
    MoneyError kind_;
};

} // namespace money::domain
