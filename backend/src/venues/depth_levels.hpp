#pragma once
#include "md/book_events.hpp"
#include "util/errors.hpp"

#include <simdjson.h>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

// Helpers shared by exchange parsers: depth levels arrive as
// [[price, qty], ...] where each number may be a JSON string ("4.00000000")
// or a JSON number depending on the exchange.
namespace depth_levels {

inline double to_double(std::string_view sv) {
    // strtod avoids locale pitfalls of stream parsing and accepts "1e-8"
    std::string tmp(sv);
    char* end = nullptr;
    double v = std::strtod(tmp.c_str(), &end);
    if (end == tmp.c_str()) {
        throw FeedError("non-numeric depth value '" + tmp + "'");
    }
    return v;
}

inline double read_number(simdjson::ondemand::value v) {
    simdjson::ondemand::json_type t;
    if (v.type().get(t)) throw FeedError("unreadable depth value");
    if (t == simdjson::ondemand::json_type::string) {
        std::string_view sv;
        if (v.get_string().get(sv)) throw FeedError("unreadable depth string");
        return to_double(sv);
    }
    double d = 0.0;
    if (v.get_double().get(d)) throw FeedError("depth value is not a number");
    return d;
}

// Appends one BookDelta per [price, qty, ...] entry of `arr`.
inline void read_side(simdjson::ondemand::array arr,
                      const std::string& symbol,
                      BookSide side,
                      std::uint64_t first_seq,
                      std::uint64_t seq,
                      std::int64_t ts_ms,
                      std::vector<BookDelta>& out) {
    for (auto elem : arr) {
        simdjson::ondemand::array level;
        if (elem.get_array().get(level)) throw FeedError("depth level is not an array");

        double px = 0.0, qty = 0.0;
        std::size_t idx = 0;
        for (auto field : level) {
            simdjson::ondemand::value v;
            if (field.get(v)) throw FeedError("unreadable depth level");
            if (idx == 0)      px = read_number(v);
            else if (idx == 1) qty = read_number(v);
            // extra columns (Bitkub order counts etc.) are ignored
            ++idx;
        }
        if (idx < 2) throw FeedError("depth level has fewer than 2 fields");

        BookDelta d;
        d.symbol    = symbol;
        d.side      = side;
        d.price     = px;
        d.size      = qty;
        d.op        = (qty == 0.0) ? BookOp::Delete : BookOp::Upsert;
        d.first_seq = first_seq;
        d.seq       = seq;
        d.ts_ms     = ts_ms;
        out.emplace_back(std::move(d));
    }
}

} // namespace depth_levels
