#pragma once
#include <string>
#include <cstdint>
#include <variant>
#include <vector>

enum class BookSide : uint8_t
{
    Bid = 0,
    Ask = 1
};
enum class BookOp : uint8_t
{
    Upsert = 0,
    Delete = 1
};

// One price level change. Exchanges that batch several levels into one event
// (Binance depthUpdate) emit one BookDelta per level, all sharing first_seq/seq.
struct BookDelta
{
    std::string symbol; // canonical "BTC_USDT"
    BookSide side{BookSide::Bid};
    double price{0};
    double size{0}; // size==0 implies delete
    BookOp op{BookOp::Upsert};
    std::uint64_t first_seq{0}; // first update id covered by the event (0 if unsequenced)
    std::uint64_t seq{0};       // last update id covered by the event (0 if unsequenced)
    std::int64_t ts_ms{0};
};

struct BookSnapshot
{
    std::string symbol; // canonical
    // Full book encoded as Upsert deltas; replaces both sides.
    std::vector<BookDelta> levels;
    std::uint64_t seq{0}; // lastUpdateId of the snapshot (0 if unsequenced)
    std::int64_t ts_ms{0};
};

using BookEvent = std::variant<BookSnapshot, BookDelta>;
