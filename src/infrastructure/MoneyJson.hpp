#pragma once

#include "domain/value_objects/Money.hpp"

#include <nlohmann/json.hpp>

namespace nlohmann {

// A Money is stored as its canonical string, so json(money) == "10.00 USD".
// Money has no default constructor, hence a serializer specialization
// instead of free to_json/from_json.
template <>
struct adl_serializer<money::domain::Money> {
    // Throws MoneyException: InvalidFormat for non-string JSON, otherwise
    // the parse error.
    static money::domain::Money from_json(const json& j);
    static void to_json(json& j, const money::domain::Money& money);
};

} // namespace nlohmann
