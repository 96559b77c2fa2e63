#include "domain/value_objects/Money.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <utility>
#include <vector>

namespace money::domain {

namespace {

constexpr uint64_t kCentsPerUnit = 100;
constexpr std::size_t kCentsDigits = 2;
constexpr std::size_t kCurrencyLength = 3;

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            return parts;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
}

// Length in UTF-8 code points.
std::size_t char_length(const std::string& str) {
    return static_cast<std::size_t>(std::count_if(str.begin(), str.end(), [](unsigned char c) {
        return (c & 0xC0) != 0x80;
    }));
}

bool all_digits(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return c >= '0' && c <= '9';
    });
}

uint64_t magnitude_of(int64_t cents) {
    return cents < 0 ? 0 - static_cast<uint64_t>(cents) : static_cast<uint64_t>(cents);
}

} // namespace

Money::Money(int64_t cents, std::string currency)
    : cents_(cents)
    , currency_(std::move(currency)) {}

MoneyResult Money::parse(const std::string& input) {
    auto parts = split(input, ' ');
    if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
        return MoneyError::InvalidFormat;
    }
    const auto& amount = parts[0];
    const auto& currency = parts[1];

    auto amount_parts = split(amount, '.');
    std::string dollars_str;
    std::string cents_str;
    if (amount_parts.size() == 2) {
        dollars_str = amount_parts[0];
        cents_str = amount_parts[1];
    } else if (amount_parts.size() == 1) {
        dollars_str = amount_parts[0];
        cents_str = "00";
    } else {
        return MoneyError::InvalidFormat;
    }

    if (char_length(cents_str) != kCentsDigits) {
        return MoneyError::InvalidCents;
    }
    if (char_length(currency) != kCurrencyLength) {
        return MoneyError::InvalidCurrency;
    }

    bool negative = !dollars_str.empty() && dollars_str.front() == '-';
    std::string digits = negative ? dollars_str.substr(1) : dollars_str;
    if (!all_digits(digits) || !all_digits(cents_str)) {
        return MoneyError::InvalidNumber;
    }

    uint64_t dollars = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), dollars);
    if (ec == std::errc::result_out_of_range) {
        return MoneyError::Overflow;
    }
    if (ec != std::errc() || end != digits.data() + digits.size()) {
        return MoneyError::InvalidNumber;
    }
    uint64_t fraction = static_cast<uint64_t>(cents_str[0] - '0') * 10
                      + static_cast<uint64_t>(cents_str[1] - '0');

    // |INT64_MIN| is one larger than INT64_MAX.
    uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + (negative ? 1 : 0);
    if (dollars > (limit - fraction) / kCentsPerUnit) {
        return MoneyError::Overflow;
    }
    uint64_t magnitude = dollars * kCentsPerUnit + fraction;

    int64_t cents = negative ? static_cast<int64_t>(0 - magnitude) : static_cast<int64_t>(magnitude);
    return Money(cents, currency);
}

Money Money::from_string(const std::string& input) {
    auto result = parse(input);
    if (const auto* error = std::get_if<MoneyError>(&result)) {
        throw MoneyException(*error);
    }
    return std::get<Money>(std::move(result));
}

MoneyResult Money::try_add(const Money& left, const Money& right) {
    if (left.currency_ != right.currency_) {
        return MoneyError::CurrencyMismatch;
    }
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();
    if ((right.cents_ > 0 && left.cents_ > max - right.cents_) ||
        (right.cents_ < 0 && left.cents_ < min - right.cents_)) {
        return MoneyError::Overflow;
    }
    return Money(left.cents_ + right.cents_, left.currency_);
}

Money Money::add(const Money& left, const Money& right) {
    auto result = try_add(left, right);
    if (const auto* error = std::get_if<MoneyError>(&result)) {
        throw MoneyException(*error);
    }
    return std::get<Money>(std::move(result));
}

std::string Money::to_string() const {
    uint64_t magnitude = magnitude_of(cents_);
    uint64_t fraction = magnitude % kCentsPerUnit;

    std::string out = cents_ < 0 ? "-" : "";
    out += std::to_string(magnitude / kCentsPerUnit);
    out += fraction < 10 ? ".0" : ".";
    out += std::to_string(fraction);
    out += ' ';
    out += currency_;
    return out;
}

std::string Money::inspect() const {
    return "\"" + to_string() + "\"_money";
}

Money operator+(const Money& left, const Money& right) {
    return Money::add(left, right);
}

std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.to_string();
}

namespace literals {

Money operator""_money(const char* str, std::size_t len) {
    return Money::from_string(std::string(str, len));
}

} // namespace literals

} // namespace money::domain
