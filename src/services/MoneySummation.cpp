#include "services/MoneySummation.hpp"

#include <optional>
#include <utility>
#include <variant>

using namespace money::domain;

namespace money::services {

MoneyResult sum_amounts(const std::vector<std::string>& amounts) {
    if (amounts.empty()) {
        return MoneyError::InvalidFormat;
    }

    std::optional<Money> total;
    for (const auto& amount : amounts) {
        auto parsed = Money::parse(amount);
        if (const auto* error = std::get_if<MoneyError>(&parsed)) {
            return *error;
        }
        auto& value = std::get<Money>(parsed);
        if (!total) {
            total = std::move(value);
            continue;
        }

        auto sum = Money::try_add(*total, value);
        if (const auto* error = std::get_if<MoneyError>(&sum)) {
            return *error;
        }
        total = std::get<Money>(std::move(sum));
    }
    return *total;
}

} // namespace money::services
