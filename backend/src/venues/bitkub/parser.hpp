#pragma once
#include "md/book_parser.hpp"
#include "md/book_events.hpp"
#include "md/symbol_codec.hpp"
#include "util/clock.hpp"
#include "util/errors.hpp"
#include "venues/depth_levels.hpp"

#include <simdjson.h>
#include <string>
#include <vector>

// Parses Bitkub market depth: {"asks":[[price, amount], ...], "bids":[...]}.
// Bitkub has no sequence numbers, so every body is an unsequenced full snapshot.
class BitkubBookParser : public IBookParser {
public:
    explicit BitkubBookParser(Ticker ticker) : canonical_(ticker.str()) {}

    // Bitkub depth is polled over REST; there is no stream frame format.
    bool parse(const std::string& raw, std::vector<BookEvent>& out) override {
        out.emplace_back(parse_snapshot(raw));
        return true;
    }

    BookSnapshot parse_snapshot(const std::string& raw) override {
        if (raw.find("\"result\":null") != std::string::npos) {
            throw FeedError("bitkub returned null result: " + raw);
        }

        simdjson::padded_string pj(raw);
        auto doc_res = parser_.iterate(pj);
        if (auto err = doc_res.error()) {
            throw FeedError(std::string("bitkub depth iterate error: ") + simdjson::error_message(err));
        }
        simdjson::ondemand::document doc = std::move(doc_res.value());

        BookSnapshot snap;
        snap.symbol = canonical_;
        snap.ts_ms  = wall_ms();

        simdjson::ondemand::array bids, asks;
        if (doc["bids"].get_array().get(bids)) throw FeedError("bitkub depth missing 'bids'");
        depth_levels::read_side(bids, canonical_, BookSide::Bid, 0, 0, snap.ts_ms, snap.levels);
        if (doc["asks"].get_array().get(asks)) throw FeedError("bitkub depth missing 'asks'");
        depth_levels::read_side(asks, canonical_, BookSide::Ask, 0, 0, snap.ts_ms, snap.levels);
        return snap;
    }

private:
    std::string canonical_;
    simdjson::ondemand::parser parser_;
};
