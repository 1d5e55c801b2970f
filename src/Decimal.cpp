/**
 * @file Decimal.cpp
 * @brief Implementation of exact decimal arithmetic
 */

#include "maxify/Decimal.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Util.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace maxify {

namespace {

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();

constexpr std::int64_t kPow10[Decimal::max_scale + 1] = {
    1LL,
    10LL,
    100LL,
    1000LL,
    10000LL,
    100000LL,
    1000000LL,
    10000000LL,
    100000000LL,
    1000000000LL,
    10000000000LL,
    100000000000LL,
    1000000000000LL,
    10000000000000LL,
    100000000000000LL,
    1000000000000000LL,
    10000000000000000LL,
    100000000000000000LL,
    1000000000000000000LL,
};

bool add_overflows(std::int64_t a, std::int64_t b) {
    return (b > 0 && a > kMax - b) || (b < 0 && a < kMin - b);
}

bool mul_overflows(std::int64_t a, std::int64_t b) {
    if (a > 0) {
        if (b > 0) return a > kMax / b;
        return b < kMin / a;
    }
    if (a < 0) {
        if (b > 0) return a < kMin / b;
        return b != 0 && b < kMax / a;
    }
    return false;
}

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
    if (add_overflows(a, b)) {
        throw std::overflow_error("Decimal addition overflow");
    }
    return a + b;
}

std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
    if (mul_overflows(a, b)) {
        throw std::overflow_error("Decimal multiplication overflow");
    }
    return a * b;
}

std::int64_t rescale(std::int64_t coefficient, int from, int to) {
    return checked_mul(coefficient, kPow10[to - from]);
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

Decimal Decimal::from_parts(std::int64_t coefficient, int scale) {
    if (scale < 0 || scale > max_scale) {
        throw std::overflow_error("Decimal scale out of range: " + std::to_string(scale));
    }
    Decimal d;
    d.coefficient_ = coefficient;
    d.scale_ = scale;
    d.normalize();
    return d;
}

Decimal Decimal::parse(const std::string& text) {
    const std::string s = trim(text);
    auto fail = [&text]() { return ParsingError("Decimal", text); };

    size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        negative = s[i] == '-';
        ++i;
    }

    std::string int_digits;
    while (i < s.size() && is_digit(s[i])) int_digits += s[i++];

    std::string frac_digits;
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && is_digit(s[i])) frac_digits += s[i++];
    }

    if (int_digits.empty() && frac_digits.empty()) {
        throw fail();
    }

    int exponent = 0;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        bool exp_negative = false;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
            exp_negative = s[i] == '-';
            ++i;
        }
        std::string exp_digits;
        while (i < s.size() && is_digit(s[i])) exp_digits += s[i++];
        if (exp_digits.empty() || exp_digits.size() > 3) {
            throw fail();
        }
        exponent = std::stoi(exp_digits);
        if (exp_negative) exponent = -exponent;
    }

    if (i != s.size()) {
        throw fail();
    }

    std::string digits = int_digits + frac_digits;
    int scale = static_cast<int>(frac_digits.size()) - exponent;

    // Canonical form first so that representable values with redundant
    // zeros are not rejected.
    auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return Decimal();
    }
    digits.erase(0, first);
    while (scale > 0 && digits.back() == '0') {
        digits.pop_back();
        --scale;
    }
    if (scale < 0) {
        digits.append(static_cast<size_t>(-scale), '0');
        scale = 0;
    }
    if (scale > max_scale || digits.size() > 19) {
        throw fail();
    }

    // Accumulate as unsigned so that the most negative value parses.
    const std::uint64_t limit = negative
        ? static_cast<std::uint64_t>(kMax) + 1
        : static_cast<std::uint64_t>(kMax);
    std::uint64_t magnitude = 0;
    for (char c : digits) {
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (magnitude > (limit - digit) / 10) {
            throw fail();
        }
        magnitude = magnitude * 10 + digit;
    }

    Decimal d;
    if (negative) {
        d.coefficient_ = magnitude == limit
            ? kMin
            : -static_cast<std::int64_t>(magnitude);
    } else {
        d.coefficient_ = static_cast<std::int64_t>(magnitude);
    }
    d.scale_ = scale;
    return d;
}

std::int64_t Decimal::truncate() const noexcept {
    return coefficient_ / kPow10[scale_];
}

std::int64_t Decimal::scaled(int digits) const {
    if (digits < 0 || digits > max_scale) {
        throw std::overflow_error("Decimal scale out of range: " + std::to_string(digits));
    }
    if (digits >= scale_) {
        return rescale(coefficient_, scale_, digits);
    }
    return coefficient_ / kPow10[scale_ - digits];
}

Decimal Decimal::abs() const {
    return coefficient_ < 0 ? -*this : *this;
}

std::string Decimal::to_string() const {
    const bool negative = coefficient_ < 0;
    const std::uint64_t magnitude = negative
        ? static_cast<std::uint64_t>(-(coefficient_ + 1)) + 1
        : static_cast<std::uint64_t>(coefficient_);

    std::string digits = std::to_string(magnitude);
    if (scale_ > 0) {
        if (digits.size() <= static_cast<size_t>(scale_)) {
            digits.insert(0, static_cast<size_t>(scale_) + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - static_cast<size_t>(scale_), 1, '.');
    }
    return negative ? "-" + digits : digits;
}

Decimal Decimal::operator-() const {
    if (coefficient_ == kMin) {
        throw std::overflow_error("Decimal negation overflow");
    }
    Decimal d = *this;
    d.coefficient_ = -coefficient_;
    return d;
}

Decimal& Decimal::operator+=(const Decimal& other) {
    const int scale = std::max(scale_, other.scale_);
    coefficient_ = checked_add(rescale(coefficient_, scale_, scale),
                               rescale(other.coefficient_, other.scale_, scale));
    scale_ = scale;
    normalize();
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    return *this += -other;
}

Decimal& Decimal::operator*=(const Decimal& other) {
    Decimal product;
    product.coefficient_ = checked_mul(coefficient_, other.coefficient_);
    product.scale_ = scale_ + other.scale_;
    product.normalize();
    if (product.scale_ > max_scale) {
        throw std::overflow_error("Decimal multiplication exceeds "
                                  + std::to_string(max_scale) + " fractional digits");
    }
    *this = product;
    return *this;
}

int Decimal::compare(const Decimal& a, const Decimal& b) noexcept {
    const std::int64_t ia = a.truncate();
    const std::int64_t ib = b.truncate();
    if (ia != ib) {
        return ia < ib ? -1 : 1;
    }

    // Same integral part: compare fractions at a common scale. Both
    // remainders are below 10^scale, so aligning cannot overflow.
    const int scale = std::max(a.scale_, b.scale_);
    const std::int64_t fa = (a.coefficient_ % kPow10[a.scale_]) * kPow10[scale - a.scale_];
    const std::int64_t fb = (b.coefficient_ % kPow10[b.scale_]) * kPow10[scale - b.scale_];
    if (fa == fb) return 0;
    return fa < fb ? -1 : 1;
}

void Decimal::normalize() noexcept {
    if (coefficient_ == 0) {
        scale_ = 0;
        return;
    }
    while (scale_ > 0 && coefficient_ % 10 == 0) {
        coefficient_ /= 10;
        --scale_;
    }
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

} // namespace maxify
