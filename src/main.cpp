#include "config/Settings.hpp"
#include "services/MoneySumCommand.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    auto settings = money::config::Settings::from_environment();
    std::vector<std::string> amounts(argv + 1, argv + argc);
    return money::services::run_money_sum(amounts, settings, std::cout, std::cerr);
}
