#include "symbol_codec.hpp"

#include <cctype>

namespace
{
// Symbols end up in file names and request URLs; only [A-Za-z0-9]+ is allowed.
bool is_alnum_word(std::string_view s)
{
    if (s.empty())
        return false;
    for (char ch : s)
        if (!std::isalnum(static_cast<unsigned char>(ch)))
            return false;
    return true;
}
} // namespace

std::optional<Ticker> Ticker::parse(std::string_view symbol)
{
    const auto idx = symbol.find('_');
    if (idx == std::string_view::npos)
        return std::nullopt;

    const auto base = symbol.substr(0, idx);
    const auto quote = symbol.substr(idx + 1);
    if (!is_alnum_word(base) || !is_alnum_word(quote))
        return std::nullopt;
    return Ticker{std::string(base), std::string(quote)};
}

std::string SymbolCodec::to_venue(Exchange venue, const Ticker &t)
{
    switch (venue)
    {
    case Exchange::Binance:
        return t.base + t.quote;
    case Exchange::Bitkub:
        return t.quote + "_" + t.base;
    }
    return t.str();
}

std::string SymbolCodec::to_stream(Exchange venue, const Ticker &t)
{
    std::string v = to_venue(venue, t);
    for (auto &ch : v)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return v;
}
