#pragma once
#include "md/book_parser.hpp"
#include "md/book_events.hpp"
#include "md/symbol_codec.hpp"
#include "util/clock.hpp"
#include "util/errors.hpp"
#include "venues/depth_levels.hpp"

#include <simdjson.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Parses Binance spot depth payloads:
//  - stream:  {"e":"depthUpdate","E":..,"s":"BTCUSDT","U":157,"u":160,"b":[["p","q"]],"a":[...]}
//  - REST:    {"lastUpdateId":1027024,"bids":[["p","q"]],"asks":[...]}
//  - REST error bodies carry {"code":-1121,"msg":"Invalid symbol."}
class BinanceBookParser : public IBookParser {
public:
    explicit BinanceBookParser(Ticker ticker)
        : canonical_(ticker.str()),
          venue_symbol_(SymbolCodec::to_venue(Exchange::Binance, ticker)) {}

    bool parse(const std::string& raw, std::vector<BookEvent>& out) override {
        // Fast reject for irrelevant frames (subscription acks, pings)
        if (raw.find("\"depthUpdate\"") == std::string::npos) return false;

        simdjson::padded_string pj(raw);
        auto doc_res = parser_.iterate(pj);
        if (auto err = doc_res.error()) {
            throw FeedError(std::string("binance frame iterate error: ") + simdjson::error_message(err));
        }
        simdjson::ondemand::document doc = std::move(doc_res.value());

        std::string_view sym_sv;
        std::uint64_t first = 0, last = 0;
        std::int64_t event_ms = 0;
        if (doc["s"].get(sym_sv)) throw FeedError("binance depthUpdate missing 's'");
        if (doc["U"].get(first))  throw FeedError("binance depthUpdate missing 'U'");
        if (doc["u"].get(last))   throw FeedError("binance depthUpdate missing 'u'");
        if (doc["E"].get(event_ms)) event_ms = wall_ms();

        // A frame for another pair keeps its own symbol so the book flags it.
        const std::string symbol = (sym_sv == venue_symbol_) ? canonical_ : std::string(sym_sv);

        std::vector<BookDelta> levels;
        simdjson::ondemand::array bids, asks;
        if (doc["b"].get_array().get(bids)) throw FeedError("binance depthUpdate missing 'b'");
        depth_levels::read_side(bids, symbol, BookSide::Bid, first, last, event_ms, levels);
        if (doc["a"].get_array().get(asks)) throw FeedError("binance depthUpdate missing 'a'");
        depth_levels::read_side(asks, symbol, BookSide::Ask, first, last, event_ms, levels);

        if (levels.empty()) {
            // Empty diff still advances the sequence; keep it as a no-op removal.
            BookDelta d;
            d.symbol = symbol;
            d.op = BookOp::Delete;
            d.first_seq = first;
            d.seq = last;
            d.ts_ms = event_ms;
            levels.push_back(std::move(d));
        }
        for (auto& d : levels) out.emplace_back(std::move(d));
        return true;
    }

    BookSnapshot parse_snapshot(const std::string& raw) override {
        if (raw.find("\"code\":-") != std::string::npos) {
            throw FeedError("binance rejected depth request: " + raw);
        }

        simdjson::padded_string pj(raw);
        auto doc_res = parser_.iterate(pj);
        if (auto err = doc_res.error()) {
            throw FeedError(std::string("binance snapshot iterate error: ") + simdjson::error_message(err));
        }
        simdjson::ondemand::document doc = std::move(doc_res.value());

        BookSnapshot snap;
        snap.symbol = canonical_;
        snap.ts_ms  = wall_ms();
        if (doc["lastUpdateId"].get(snap.seq)) throw FeedError("binance snapshot missing 'lastUpdateId'");

        simdjson::ondemand::array bids, asks;
        if (doc["bids"].get_array().get(bids)) throw FeedError("binance snapshot missing 'bids'");
        depth_levels::read_side(bids, canonical_, BookSide::Bid, 0, 0, snap.ts_ms, snap.levels);
        if (doc["asks"].get_array().get(asks)) throw FeedError("binance snapshot missing 'asks'");
        depth_levels::read_side(asks, canonical_, BookSide::Ask, 0, 0, snap.ts_ms, snap.levels);
        return snap;
    }

private:
    std::string canonical_;
    std::string venue_symbol_;
    simdjson::ondemand::parser parser_;
};
