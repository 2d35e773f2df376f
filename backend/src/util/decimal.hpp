#pragma once
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <optional>
#include <string>
#include <string_view>

// Exact decimal value for prices and volumes.
// Input is the plain wire form "123" or "123.45"; no sign, exponent or spaces.
class Decimal {
public:
    using value_type = boost::multiprecision::cpp_dec_float_50;

    // Fractional digits kept when rendering derived values (mean, std_dev).
    static constexpr int kOutputScale = 12;

    Decimal() = default;
    explicit Decimal(long long v) : v_(v) {}

    static std::optional<Decimal> parse(std::string_view text);
    static bool is_plain(std::string_view text);
    // Digits after the point in plain text, 0 when there is none.
    static int fraction_digits(std::string_view text);

    // Fixed notation rounded to `scale` digits, trailing zeros trimmed.
    // Exact when `scale` covers every fractional digit of the value.
    std::string str(int scale = kOutputScale) const;

    bool is_zero() const { return v_.is_zero(); }
    bool positive() const { return v_ > 0; }

    Decimal sqrt() const;

    Decimal& operator+=(const Decimal& o) { v_ += o.v_; return *this; }
    Decimal& operator-=(const Decimal& o) { v_ -= o.v_; return *this; }

    friend Decimal operator+(Decimal a, const Decimal& b) { a.v_ += b.v_; return a; }
    friend Decimal operator-(Decimal a, const Decimal& b) { a.v_ -= b.v_; return a; }
    friend Decimal operator*(Decimal a, const Decimal& b) { a.v_ *= b.v_; return a; }
    friend Decimal operator/(Decimal a, const Decimal& b) { a.v_ /= b.v_; return a; }

    friend bool operator<(const Decimal& a, const Decimal& b) { return a.v_ < b.v_; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return a.v_ > b.v_; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return a.v_ <= b.v_; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return a.v_ >= b.v_; }
    friend bool operator==(const Decimal& a, const Decimal& b) { return a.v_ == b.v_; }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return a.v_ != b.v_; }

private:
    explicit Decimal(value_type v) : v_(std::move(v)) {}

    value_type v_{0};
};
