#pragma once
#include <string>

// Canonical symbols are upper case "BASE/QUOTE" ("BTC/USD").
struct SymbolCodec
{
    // Canonical to venue format: coinbase "BTC-USD", kraken "XBT/USD", binance "BTCUSDT".
    static std::string to_venue(const std::string &venue, const std::string &canonical);
    // Venue format back to canonical. Unknown venues only get upper-cased.
    static std::string to_canonical(const std::string &venue, const std::string &venue_sym);
    // True when `s` looks like "BASE/QUOTE" with upper case letters on both sides.
    static bool is_canonical(const std::string &s);
};
