#pragma once

#include "domain/value_objects/Money.hpp"

#include <string>

namespace money::services {

// "json" -> "\"10.00 USD\"", "inspect" -> "\"10.00 USD\"_money",
// anything else -> "10.00 USD".
std::string render(const domain::Money& money, const std::string& format);

} // namespace money::services
