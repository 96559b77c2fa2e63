#include "services/MoneyRendering.hpp"

#include "infrastructure/MoneyJson.hpp"

#include <nlohmann/json.hpp>

namespace money::services {

std::string render(const domain::Money& money, const std::string& format) {
    if (format == "json") {
        return nlohmann::json(money).dump();
    }
    if (format == "inspect") {
        return money.inspect();
    }
    return money.to_string();
}

} // namespace money::services
