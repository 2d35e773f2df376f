#include "util/decimal.hpp"

#include <cctype>
#include <ios>

bool Decimal::is_plain(std::string_view s)
{
    if (s.empty()) return false;
    std::size_t i = 0;
    std::size_t int_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++int_digits; }
    if (int_digits == 0) return false;
    if (i == s.size()) return true;
    if (s[i] != '.') return false;
    ++i;
    std::size_t frac_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++frac_digits; }
    return frac_digits > 0 && i == s.size();
}

int Decimal::fraction_digits(std::string_view text)
{
    auto dot = text.find('.');
    if (dot == std::string_view::npos) return 0;
    return static_cast<int>(text.size() - dot - 1);
}

std::optional<Decimal> Decimal::parse(std::string_view text)
{
    if (!is_plain(text)) return std::nullopt;
    return Decimal(value_type(std::string(text)));
}

std::string Decimal::str(int scale) const
{
    std::string out = v_.str(scale, std::ios_base::fixed);
    auto dot = out.find('.');
    if (dot != std::string::npos) {
        while (!out.empty() && out.back() == '0') out.pop_back();
        if (!out.empty() && out.back() == '.') out.pop_back();
    }
    if (out == "-0") out = "0";
    return out;
}

Decimal Decimal::sqrt() const
{
    if (v_ <= 0) return Decimal{};
    return Decimal(value_type(boost::multiprecision::sqrt(v_)));
}
