#pragma once

#include "config/Settings.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace money::services {

// Body of money_sum. Only the rendered total goes to `out`; usage, errors
// and verbose logging go to `err`. Returns the process exit code.
int run_money_sum(const std::vector<std::string>& amounts,
                  const config::Settings& settings,
                  std::ostream& out,
                  std::ostream& err);

} // namespace money::services
