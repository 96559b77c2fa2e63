#include "domain/value_objects/MoneyError.hpp"

namespace money::domain {

std::string to_string(MoneyError error) {
    switch (error) {
        case MoneyError::InvalidFormat: return "invalid_format";
        case MoneyError::InvalidCents: return "invalid_cents";
        case MoneyError::InvalidCurrency: return "invalid_currency";
        case MoneyError::InvalidNumber: return "invalid_number";
        case MoneyError::CurrencyMismatch: return "currency_mismatch";
        case MoneyError::Overflow: return "overflow";
    }
    throw std::invalid_argument("Unknown MoneyError: " + std::to_string(static_cast<int>(error)));
}

MoneyException::MoneyException(MoneyError kind)
    : std::invalid_argument(to_string(kind))
    , kind_(kind) {}

} // namespace money::domain
