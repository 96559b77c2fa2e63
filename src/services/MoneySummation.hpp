#pragma once

#include "domain/value_objects/Money.hpp"

#include <string>
#include <vector>

namespace money::services {

// Parses each amount and adds them left to right. Returns the first error
// in input order; an empty list is InvalidFormat.
domain::MoneyResult sum_amounts(const std::vector<std::string>& amounts);

} // namespace money::services
