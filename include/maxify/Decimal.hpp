/**
 * @file Decimal.hpp
 * @brief Exact base-10 decimal number
 *
 * Decimal stores a signed 64-bit coefficient and a base-10 scale
 * (number of digits after the decimal point, 0..18). Values are kept in
 * canonical form, without trailing fractional zeros, so two equal numbers
 * always have the same representation.
 *
 * Addition, subtraction and multiplication are exact. An operation whose
 * result does not fit the representation throws std::overflow_error
 * instead of rounding.
 */

#ifndef MAXIFY_DECIMAL_HPP
#define MAXIFY_DECIMAL_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace maxify {

class Decimal {
public:
    /// Largest supported number of fractional digits
    static constexpr int max_scale = 18;

    Decimal() = default;

    /**
     * @brief Construct an integral value
     */
    Decimal(std::int64_t value) : coefficient_(value), scale_(0) {}

    /**
     * @brief Construct from coefficient and scale (value = coefficient / 10^scale)
     * @throws std::overflow_error if scale is outside 0..max_scale
     */
    static Decimal from_parts(std::int64_t coefficient, int scale);

    /**
     * @brief Parse decimal text
     *
     * Accepts an optional sign, digits with an optional fraction and an
     * optional exponent: "500", "-3.25", "4.", ".5", "1.5e3".
     * Surrounding whitespace is ignored.
     *
     * @throws ParsingError on malformed text or a value that cannot be
     *         represented exactly
     */
    static Decimal parse(const std::string& text);

    std::int64_t coefficient() const noexcept { return coefficient_; }
    int scale() const noexcept { return scale_; }

    bool is_zero() const noexcept { return coefficient_ == 0; }
    bool is_integer() const noexcept { return scale_ == 0; }
    int sign() const noexcept { return (coefficient_ > 0) - (coefficient_ < 0); }

    /**
     * @brief Integral part, truncated toward zero
     */
    std::int64_t truncate() const noexcept;

    /**
     * @brief Coefficient at a fixed number of fractional digits, truncated
     *        toward zero (e.g. 4.5 scaled to 6 digits is 4500000)
     * @throws std::overflow_error if the result does not fit
     */
    std::int64_t scaled(int digits) const;

    Decimal abs() const;

    /**
     * @brief Plain (non-exponent) text form, e.g. "-1500.56"
     */
    std::string to_string() const;

    Decimal operator-() const;
    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);
    Decimal& operator*=(const Decimal& other);

    friend Decimal operator+(Decimal lhs, const Decimal& rhs) { return lhs += rhs; }
    friend Decimal operator-(Decimal lhs, const Decimal& rhs) { return lhs -= rhs; }
    friend Decimal operator*(Decimal lhs, const Decimal& rhs) { return lhs *= rhs; }

    friend bool operator==(const Decimal& a, const Decimal& b) noexcept {
        return a.coefficient_ == b.coefficient_ && a.scale_ == b.scale_;
    }
    friend bool operator!=(const Decimal& a, const Decimal& b) noexcept { return !(a == b); }
    friend bool operator<(const Decimal& a, const Decimal& b) noexcept { return compare(a, b) < 0; }
    friend bool operator<=(const Decimal& a, const Decimal& b) noexcept { return compare(a, b) <= 0; }
    friend bool operator>(const Decimal& a, const Decimal& b) noexcept { return compare(a, b) > 0; }
    friend bool operator>=(const Decimal& a, const Decimal& b) noexcept { return compare(a, b) >= 0; }

    /**
     * @brief Three-way comparison
     * @return negative, zero or positive
     */
    static int compare(const Decimal& a, const Decimal& b) noexcept;

private:
    std::int64_t coefficient_ = 0;
    int scale_ = 0;

    void normalize() noexcept;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace maxify

#endif // MAXIFY_DECIMAL_HPP
