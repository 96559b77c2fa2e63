#include "services/MoneySumCommand.hpp"

#include "services/MoneyRendering.hpp"
#include "services/MoneySummation.hpp"

#include <exception>
#include <variant>

using namespace money::domain;

namespace money::services {

int run_money_sum(const std::vector<std::string>& amounts,
                  const config::Settings& settings,
                  std::ostream& out,
                  std::ostream& err) {
    if (amounts.empty()) {
        err << "Usage: money_sum <amount> [amount ...]" << std::endl;
        err << "       e.g. money_sum \"10.00 USD\" \"5.25 USD\"" << std::endl;
        return 1;
    }

    try {
        if (settings.logging.verbose) {
            for (const auto& amount : amounts) {
                auto parsed = Money::parse(amount);
                if (const auto* value = std::get_if<Money>(&parsed)) {
                    err << "[money] parsed " << value->inspect() << std::endl;
                }
            }
        }

        auto result = sum_amounts(amounts);
        if (const auto* error = std::get_if<MoneyError>(&result)) {
            err << "[money] error: " << to_string(*error) << std::endl;
            return 1;
        }

        out << render(std::get<Money>(result), settings.output.format) << std::endl;
    } catch (const std::exception& e) {
        err << "[money] error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace money::services
