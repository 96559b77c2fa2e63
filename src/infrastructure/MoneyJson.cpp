#include "infrastructure/MoneyJson.hpp"

using money::domain::Money;
using money::domain::MoneyError;
using money::domain::MoneyException;

namespace nlohmann {

Money adl_serializer<Money>::from_json(const json& j) {
    if (!j.is_string()) {
        throw MoneyException(MoneyError::InvalidFormat);
    }
    return Money::from_string(j.get<std::string>());
}

void adl_serializer<Money>::to_json(json& j, const Money& money) {
    j = money.to_string();
}

} // namespace nlohmann
