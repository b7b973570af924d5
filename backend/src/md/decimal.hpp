#pragma once
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

// Fixed-point decimal with 8 fractional digits (1e-8 units).
// Wire prices are parsed from their JSON text, never through a double.
class Decimal {
public:
    static constexpr int kScale = 8;
    static constexpr std::int64_t kUnit = 100000000;

    constexpr Decimal() = default;

    static constexpr Decimal from_units(std::int64_t units) {
        Decimal d;
        d.units_ = units;
        return d;
    }
    static constexpr Decimal from_int(std::int64_t whole) { return from_units(whole * kUnit); }

    // Rounds to the nearest 1e-8. Only for values that already are doubles (Greeks, IV).
    static Decimal from_double(double v);

    // Accepts "-12.5", "185.64", "1.5e-05", "7". Throws std::invalid_argument.
    static Decimal parse(std::string_view text);
    // Same grammar; returns false instead of throwing. Digits past 1e-8 are rounded half away from zero.
    static bool try_parse(std::string_view text, Decimal& out);

    constexpr std::int64_t units() const { return units_; }
    constexpr bool is_zero() const { return units_ == 0; }
    constexpr bool is_negative() const { return units_ < 0; }

    double to_double() const;
    // Shortest exact text, e.g. "185.64", "0", "-0.00000001".
    std::string to_string() const;

    // (a + b) / 2 rounded half away from zero.
    Decimal midpoint(Decimal other) const;

    // Throw std::overflow_error when the result leaves the 64-bit range.
    Decimal operator+(Decimal o) const;
    Decimal operator-(Decimal o) const;
    Decimal operator/(std::int64_t divisor) const;

    friend constexpr auto operator<=>(const Decimal&, const Decimal&) = default;
    friend constexpr bool operator==(const Decimal&, const Decimal&) = default;

private:
    std::int64_t units_{0};
};
