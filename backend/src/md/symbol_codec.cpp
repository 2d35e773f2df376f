#include "symbol_codec.hpp"

#include <array>
#include <cctype>
#include <string_view>

namespace
{
    std::string upper(std::string s)
    {
        for (auto &ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        return s;
    }

    std::string lower(std::string s)
    {
        for (auto &ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        return s;
    }

    std::string replace_char(std::string s, char from, char to)
    {
        for (auto &ch : s)
            if (ch == from)
                ch = to;
        return s;
    }

    // Longest first so "USDT" wins over "USD".
    constexpr std::array<std::string_view, 8> kBinanceQuotes{
        "FDUSD", "USDT", "USDC", "BUSD", "USD", "EUR", "BTC", "ETH"};

    std::string binance_quote_to_canonical(std::string_view q)
    {
        if (q == "USDT") return "USD";
        return std::string(q);
    }
}

std::string SymbolCodec::to_venue(const std::string &venue, const std::string &c)
{
    const std::string venue_lc = lower(venue);
    const std::string canonical = upper(c);
    const auto slash = canonical.find('/');

    if (venue_lc == "kraken")
    {
        if (slash != std::string::npos && canonical.substr(0, slash) == "BTC")
            return "XBT" + canonical.substr(slash);
        return canonical;
    }
    else if (venue_lc == "coinbase")
    {
        return replace_char(canonical, '/', '-');
    }
    else if (venue_lc == "binance")
    {
        if (slash == std::string::npos) return canonical;
        std::string quote = canonical.substr(slash + 1);
        if (quote == "USD") quote = "USDT";
        return canonical.substr(0, slash) + quote;
    }
    return canonical;
}

std::string SymbolCodec::to_canonical(const std::string &venue, const std::string &v)
{
    const std::string venue_lc = lower(venue);
    const std::string sym = upper(v);

    if (venue_lc == "kraken")
    {
        const auto slash = sym.find('/');
        if (slash == std::string::npos) return sym;
        std::string base = sym.substr(0, slash);
        std::string quote = sym.substr(slash + 1);
        if (base == "XBT") base = "BTC";
        if (quote == "XBT") quote = "BTC";
        return base + "/" + quote;
    }
    else if (venue_lc == "coinbase")
    {
        return replace_char(sym, '-', '/');
    }
    else if (venue_lc == "binance")
    {
        for (auto q : kBinanceQuotes)
        {
            if (sym.size() > q.size() &&
                std::string_view(sym).substr(sym.size() - q.size()) == q)
            {
                return sym.substr(0, sym.size() - q.size()) + "/" + binance_quote_to_canonical(q);
            }
        }
        return sym;
    }
    return sym;
}

bool SymbolCodec::is_canonical(const std::string &s)
{
    const auto slash = s.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == s.size()) return false;
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (i == slash) continue;
        if (s[i] < 'A' || s[i] > 'Z') return false;
    }
    return true;
}
