#include "decimal.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n' || s.front() == '\r'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

} // namespace

Decimal Decimal::from_double(double v) {
    if (!std::isfinite(v)) {
        throw std::invalid_argument("Decimal::from_double: non-finite value");
    }
    const double scaled = std::round(v * static_cast<double>(kUnit));
    if (std::fabs(scaled) >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        throw std::invalid_argument("Decimal::from_double: out of range");
    }
    return from_units(static_cast<std::int64_t>(scaled));
}

Decimal Decimal::parse(std::string_view text) {
    Decimal d;
    if (!try_parse(text, d)) {
        throw std::invalid_argument("invalid decimal: '" + std::string(text) + "'");
    }
    return d;
}

bool Decimal::try_parse(std::string_view text, Decimal& out) {
    std::string_view s = trim(text);
    std::size_t i = 0;

    bool negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        negative = (s[i] == '-');
        ++i;
    }

    std::string digits;
    int frac_digits = 0;
    bool seen_dot = false;
    bool any_digit = false;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (is_digit(c)) {
            digits.push_back(c);
            if (seen_dot) ++frac_digits;
            any_digit = true;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            break;
        }
    }
    if (!any_digit) return false;

    int exponent = 0;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        bool exp_negative = false;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
            exp_negative = (s[i] == '-');
            ++i;
        }
        bool any_exp = false;
        for (; i < s.size() && is_digit(s[i]); ++i) {
            if (exponent > 400) return false;
            exponent = exponent * 10 + (s[i] - '0');
            any_exp = true;
        }
        if (!any_exp) return false;
        if (exp_negative) exponent = -exponent;
    }
    if (i != s.size()) return false;

    // value = digits * 10^(exponent - frac_digits); units = value * 10^kScale
    const int shift = kScale + exponent - frac_digits;
    bool round_up = false;
    if (shift >= 0) {
        digits.append(static_cast<std::size_t>(shift), '0');
    } else {
        const std::size_t drop = static_cast<std::size_t>(-shift);
        if (drop >= digits.size()) {
            round_up = (drop == digits.size()) && digits.front() >= '5';
            digits = "0";
        } else {
            round_up = digits[digits.size() - drop] >= '5';
            digits.resize(digits.size() - drop);
        }
    }

    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        digits = "0";
    } else {
        digits.erase(0, first);
    }

    std::int64_t units = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), units);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) return false;
    if (round_up) {
        if (units == std::numeric_limits<std::int64_t>::max()) return false;
        ++units;
    }

    out = from_units(negative ? -units : units);
    return true;
}

double Decimal::to_double() const {
    return static_cast<double>(units_) / static_cast<double>(kUnit);
}

std::string Decimal::to_string() const {
    const bool negative = units_ < 0;
    const std::uint64_t magnitude = negative
        ? static_cast<std::uint64_t>(-(units_ + 1)) + 1
        : static_cast<std::uint64_t>(units_);

    const std::uint64_t whole = magnitude / static_cast<std::uint64_t>(kUnit);
    std::uint64_t frac = magnitude % static_cast<std::uint64_t>(kUnit);

    std::string out = negative ? "-" : "";
    out += std::to_string(whole);
    if (frac != 0) {
        std::string f = std::to_string(frac);
        f.insert(0, static_cast<std::size_t>(kScale) - f.size(), '0');
        while (!f.empty() && f.back() == '0') f.pop_back();
        out += '.';
        out += f;
    }
    return out;
}

Decimal Decimal::operator+(Decimal o) const {
    std::int64_t sum = 0;
    if (__builtin_add_overflow(units_, o.units_, &sum)) {
        throw std::overflow_error("Decimal: " + to_string() + " + " + o.to_string() + " overflows");
    }
    return from_units(sum);
}

Decimal Decimal::operator-(Decimal o) const {
    std::int64_t diff = 0;
    if (__builtin_sub_overflow(units_, o.units_, &diff)) {
        throw std::overflow_error("Decimal: " + to_string() + " - " + o.to_string() + " overflows");
    }
    return from_units(diff);
}

Decimal Decimal::operator/(std::int64_t divisor) const {
    if (divisor == 0) {
        throw std::domain_error("Decimal: division by zero");
    }
    if (divisor == -1 && units_ == std::numeric_limits<std::int64_t>::min()) {
        throw std::overflow_error("Decimal: " + to_string() + " / -1 overflows");
    }
    std::int64_t q = units_ / divisor;
    const std::int64_t r = units_ % divisor;
    const std::int64_t abs_r = r < 0 ? -r : r;
    const std::int64_t abs_d = divisor < 0 ? -divisor : divisor;
    if (abs_r * 2 >= abs_d) {
        q += ((units_ < 0) != (divisor < 0)) ? -1 : 1;
    }
    return from_units(q);
}

Decimal Decimal::midpoint(Decimal other) const {
    // Halve first so the sum cannot overflow; the result always fits.
    std::int64_t q = units_ / 2 + other.units_ / 2;
    std::int64_t r = units_ % 2 + other.units_ % 2; // -2..2
    q += r / 2;
    r %= 2;
    if (r > 0 && q >= 0) ++q;
    if (r < 0 && q <= 0) --q;
    return from_units(q);
}
